#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mpu::util {

/**
 * @brief Percent-encode a string for use in a URL path segment or query value
 *
 * Unreserved characters (A-Z a-z 0-9 - _ . ! ~ * ' ( )) pass through,
 * every other byte becomes %XX.
 */
std::string percent_encode(const std::string& text);

/**
 * @brief Reverse of percent_encode
 *
 * @param plus_as_space Decode '+' as ' ' (query strings)
 * @return std::nullopt on a truncated or non-hex escape
 */
std::optional<std::string> percent_decode(const std::string& text, bool plus_as_space = false);

/**
 * @brief Split "a=1&b=2" into a map; keys and values are percent-decoded
 *
 * Malformed escapes keep the raw text. Later duplicates win.
 */
std::unordered_map<std::string, std::string> parse_query(const std::string& query);

/**
 * @brief UTC timestamp as "2024-05-01T12:30:00.250Z"
 */
std::string format_timestamp(std::chrono::system_clock::time_point time);

/// Inverse of format_timestamp; the fractional part is optional
std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& text);

/**
 * @brief 64-bit FNV-1a digest rendered as 16 lowercase hex digits
 */
std::string fnv1a_hex(const std::uint8_t* data, std::size_t length);
std::string fnv1a_hex(const std::vector<std::uint8_t>& data);
std::string fnv1a_hex(const std::string& text);

/**
 * @brief Incremental FNV-1a for streamed data
 */
class Fnv1a {
public:
    void update(const std::uint8_t* data, std::size_t length) noexcept;
    [[nodiscard]] std::uint64_t digest() const noexcept { return hash_; }
    [[nodiscard]] std::string hex() const;

private:
    std::uint64_t hash_ = 0xcbf29ce484222325ULL;
};

} // namespace mpu::util
