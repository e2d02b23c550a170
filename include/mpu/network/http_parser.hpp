#pragma once

#include "mpu/core/result.hpp"
#include "mpu/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <string>

namespace mpu {
namespace network {

/**
 * @brief State machine states for HTTP request parsing
 *
 * METHOD SP URL SP VERSION CRLF    <- Request line
 * Header-Name: Header-Value CRLF   <- Headers (multiple)
 * CRLF                             <- Empty line
 * [Body]                           <- Content-Length bytes
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Why a request could not be parsed, with the status to answer with
 */
struct ParseError {
    HttpStatus status = HttpStatus::BAD_REQUEST;
    std::string message;
};

/**
 * @brief Incremental HTTP request parser
 *
 * Data may be fed in arbitrary chunks as it arrives from the socket. The
 * request line and headers are consumed byte by byte; the body is copied in
 * bulk once Content-Length is known. A declared body larger than
 * max_body_size fails with PAYLOAD_TOO_LARGE before any of it is buffered.
 *
 * ```cpp
 * HttpParser parser(11 * 1024 * 1024);
 * auto result = parser.parse(buffer, n);
 * if (result.is_error()) {
 *     // answer with result.error().status
 * } else if (result.value()) {
 *     HttpRequest request = parser.take_request();
 * }
 * ```
 */
class HttpParser {
public:
    static constexpr size_t kUnlimited = std::numeric_limits<size_t>::max();

    explicit HttpParser(size_t max_body_size = kUnlimited) : max_body_size_(max_body_size) { reset(); }

    /**
     * @brief Parse incoming data
     *
     * @return true once a full request has been read, false if more data is needed
     */
    Result<bool, ParseError> parse(const char* data, size_t len) {
        size_t i = 0;
        while (i < len) {
            if (state_ == ParseState::COMPLETE) {
                return done(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return fail(HttpStatus::BAD_REQUEST, "Parser in error state");
            }

            if (state_ == ParseState::BODY) {
                size_t take = std::min(len - i, body_length_ - request_.body.size());
                request_.body.insert(request_.body.end(),
                                     reinterpret_cast<const uint8_t*>(data + i),
                                     reinterpret_cast<const uint8_t*>(data + i + take));
                i += take;
                if (request_.body.size() >= body_length_) {
                    state_ = ParseState::COMPLETE;
                }
                continue;
            }

            char c = data[i++];
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::METHOD:
                    ok = parse_method(c);
                    break;
                case ParseState::URL:
                    ok = parse_url(c);
                    break;
                case ParseState::VERSION:
                    ok = parse_version(c);
                    break;
                case ParseState::HEADER_NAME:
                    ok = parse_header_name(c);
                    break;
                case ParseState::HEADER_VALUE:
                    ok = parse_header_value(c);
                    break;
                default:
                    break;
            }

            if (!ok) {
                if (error_.empty()) {
                    error_ = "Malformed request at line " + std::to_string(line_);
                }
                HttpStatus status = error_status_;
                state_ = ParseState::PARSE_ERROR;
                return fail(status, error_);
            }
        }

        return done(state_ == ParseState::COMPLETE);
    }

    const HttpRequest& get_request() const { return request_; }

    HttpRequest take_request() { return std::move(request_); }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }

    size_t max_body_size() const { return max_body_size_; }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        error_.clear();
        error_status_ = HttpStatus::BAD_REQUEST;
        body_length_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    size_t max_body_size_;
    ParseState state_;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    std::string error_;
    HttpStatus error_status_;
    size_t body_length_;
    size_t line_;
    bool last_char_was_cr_;

    static Result<bool, ParseError> done(bool complete) {
        return Result<bool, ParseError>(OkValue<bool>(complete));
    }

    static Result<bool, ParseError> fail(HttpStatus status, std::string message) {
        return Err<bool, ParseError>(ParseError{status, std::move(message)});
    }

    bool reject(HttpStatus status, std::string message) {
        error_status_ = status;
        error_ = std::move(message);
        return false;
    }

    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return reject(HttpStatus::BAD_REQUEST, "Empty HTTP method");
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return reject(HttpStatus::NOT_IMPLEMENTED, "Unsupported HTTP method: " + buffer_);
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }

        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return reject(HttpStatus::BAD_REQUEST, "Empty request URL");
            }
            request_.url = buffer_;
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }

        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                return reject(HttpStatus::BAD_REQUEST, "Unknown HTTP version: " + buffer_);
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            return finish_headers();
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return reject(HttpStatus::BAD_REQUEST, "Empty header name");
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && c == ' ') {
            return true;
        }

        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            request_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool finish_headers() {
        if (header_present("Transfer-Encoding")) {
            return reject(HttpStatus::NOT_IMPLEMENTED, "Chunked request bodies are not supported");
        }

        std::string content_length = request_.get_header("Content-Length");
        if (content_length.empty()) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        unsigned long long declared = 0;
        const char* first = content_length.data();
        const char* last = first + content_length.size();
        auto [end, ec] = std::from_chars(first, last, declared);
        if (ec != std::errc() || end != last) {
            return reject(HttpStatus::BAD_REQUEST, "Invalid Content-Length: " + content_length);
        }
        if (declared > max_body_size_) {
            return reject(HttpStatus::PAYLOAD_TOO_LARGE,
                          "Request body of " + content_length + " bytes exceeds limit of " +
                          std::to_string(max_body_size_) + " bytes");
        }

        body_length_ = static_cast<size_t>(declared);
        if (body_length_ == 0) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        request_.body.reserve(body_length_);
        state_ = ParseState::BODY;
        return true;
    }

    bool header_present(const std::string& name) const {
        for (const auto& entry : request_.headers) {
            if (header_name_equals(entry.first, name)) {
                return true;
            }
        }
        return false;
    }
};

} // namespace network
} // namespace mpu
