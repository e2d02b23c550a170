#include "mpu/util/encoding.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mpu::util {
namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";

bool is_unreserved(unsigned char c) {
    if (std::isalnum(c)) {
        return true;
    }
    switch (c) {
        case '-': case '_': case '.': case '!': case '~':
        case '*': case '\'': case '(': case ')':
            return true;
        default:
            return false;
    }
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string percent_encode(const std::string& text) {
    std::string encoded;
    encoded.reserve(text.size());
    for (char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            encoded += ch;
        } else {
            encoded += '%';
            encoded += kHexDigits[c >> 4];
            encoded += kHexDigits[c & 0x0F];
        }
    }
    return encoded;
}

std::optional<std::string> percent_decode(const std::string& text, bool plus_as_space) {
    std::string decoded;
    decoded.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '%') {
            if (i + 2 >= text.size()) {
                return std::nullopt;
            }
            const int high = hex_value(text[i + 1]);
            const int low = hex_value(text[i + 2]);
            if (high < 0 || low < 0) {
                return std::nullopt;
            }
            decoded += static_cast<char>((high << 4) | low);
            i += 2;
        } else if (c == '+' && plus_as_space) {
            decoded += ' ';
        } else {
            decoded += c;
        }
    }
    return decoded;
}

std::unordered_map<std::string, std::string> parse_query(const std::string& query) {
    std::unordered_map<std::string, std::string> params;
    std::size_t pos = 0;
    while (pos <= query.size()) {
        auto amp = query.find('&', pos);
        if (amp == std::string::npos) {
            amp = query.size();
        }
        const std::string pair = query.substr(pos, amp - pos);
        if (!pair.empty()) {
            const auto eq = pair.find('=');
            const std::string raw_key = pair.substr(0, eq);
            const std::string raw_value = eq == std::string::npos ? std::string{} : pair.substr(eq + 1);
            params[percent_decode(raw_key, true).value_or(raw_key)] =
                percent_decode(raw_value, true).value_or(raw_value);
        }
        pos = amp + 1;
    }
    return params;
}

std::string format_timestamp(std::chrono::system_clock::time_point time) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
    std::time_t seconds = static_cast<std::time_t>(ms / 1000);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << (ms % 1000) << 'Z';
    return oss.str();
}

std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& text) {
    std::tm utc{};
    std::istringstream iss(text);
    iss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }

    int millis = 0;
    if (iss.peek() == '.') {
        iss.get();
        std::string digits;
        while (std::isdigit(iss.peek())) {
            digits += static_cast<char>(iss.get());
        }
        if (digits.empty()) {
            return std::nullopt;
        }
        digits.resize(3, '0');
        millis = std::stoi(digits);
    }
    if (iss.get() != 'Z') {
        return std::nullopt;
    }

    const std::time_t seconds = timegm(&utc);
    return std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

void Fnv1a::update(const std::uint8_t* data, std::size_t length) noexcept {
    constexpr std::uint64_t prime = 0x100000001b3ULL;
    for (std::size_t i = 0; i < length; ++i) {
        hash_ ^= static_cast<std::uint64_t>(data[i]);
        hash_ *= prime;
    }
}

std::string Fnv1a::hex() const {
    std::ostringstream oss;
    oss << std::hex << std::setw(sizeof(hash_) * 2) << std::setfill('0') << hash_;
    return oss.str();
}

std::string fnv1a_hex(const std::uint8_t* data, std::size_t length) {
    Fnv1a hasher;
    hasher.update(data, length);
    return hasher.hex();
}

std::string fnv1a_hex(const std::vector<std::uint8_t>& data) {
    return fnv1a_hex(data.data(), data.size());
}

std::string fnv1a_hex(const std::string& text) {
    return fnv1a_hex(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

} // namespace mpu::util
