#pragma once

#include "mpu/stream/byte_stream.hpp"

#include <cstdint>
#include <cstring>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <strings.h>

namespace mpu {
namespace network {

/**
 * @brief HTTP request methods as defined in RFC 7231
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // DELETE collides with a Windows macro
    HEAD,
    OPTIONS,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

/**
 * @brief HTTP status codes used by the relay and its clients
 */
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    PAYLOAD_TOO_LARGE = 413,
    INTERNAL_SERVER_ERROR = 500,
    NOT_IMPLEMENTED = 501,
    BAD_GATEWAY = 502,
    SERVICE_UNAVAILABLE = 503
};

inline bool header_name_equals(const std::string& a, const std::string& b) {
    return strcasecmp(a.c_str(), b.c_str()) == 0;
}

/**
 * @brief Represents an HTTP request
 *
 * The url keeps the query string as received; the router splits it off.
 * Body is std::vector<uint8_t> because part payloads are binary.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;
    HttpVersion version = HttpVersion::HTTP_1_1;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    /**
     * @brief Get a header value (case-insensitive lookup)
     *
     * @return Header value if found, empty string otherwise
     */
    std::string get_header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (header_name_equals(key, name)) {
                return value;
            }
        }
        return "";
    }

    bool has_header(const std::string& name) const {
        return !get_header(name).empty();
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

/**
 * @brief Represents an HTTP response
 *
 * A response carries either an in-memory body or a body_stream. Streamed
 * bodies are never buffered: the server writes serialize_head() and then
 * pumps the source, and Content-Length must be set by set_stream().
 *
 * HTTP/1.1 200 OK\r\n
 * Content-Type: application/octet-stream\r\n
 * Content-Length: 13\r\n
 * \r\n
 * <body>
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;
    std::shared_ptr<stream::ByteSource> body_stream;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
    }

    /**
     * @brief Set response body from a string
     *
     * Automatically sets Content-Length header.
     */
    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        body_stream.reset();
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_body(const std::vector<uint8_t>& data) {
        body = data;
        body_stream.reset();
        headers["Content-Length"] = std::to_string(body.size());
    }

    /**
     * @brief Attach a body that is produced while writing
     *
     * @param source Byte source, read until EOF
     * @param length Exact number of bytes the source yields
     */
    void set_stream(std::shared_ptr<stream::ByteSource> source, uint64_t length) {
        body.clear();
        body_stream = std::move(source);
        headers["Content-Length"] = std::to_string(length);
    }

    bool is_streamed() const { return body_stream != nullptr; }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string get_header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (header_name_equals(key, name)) {
                return value;
            }
        }
        return "";
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Status line and headers, terminated by the empty line
     */
    std::vector<uint8_t> serialize_head() const {
        std::ostringstream oss;

        oss << version_to_string(version) << " "
            << status_code << " "
            << reason_phrase << "\r\n";

        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }

        oss << "\r\n";

        std::string head = oss.str();
        return std::vector<uint8_t>(head.begin(), head.end());
    }

    /**
     * @brief Serialize the response with its in-memory body
     *
     * Streamed bodies are not included.
     */
    std::vector<uint8_t> serialize() const {
        std::vector<uint8_t> result = serialize_head();
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }

    static std::string get_reason_phrase(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::CREATED: return "Created";
            case HttpStatus::NO_CONTENT: return "No Content";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::PAYLOAD_TOO_LARGE: return "Payload Too Large";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::NOT_IMPLEMENTED: return "Not Implemented";
            case HttpStatus::BAD_GATEWAY: return "Bad Gateway";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
            default: return "Unknown";
        }
    }

    static std::string version_to_string(HttpVersion version) {
        switch (version) {
            case HttpVersion::HTTP_1_0: return "HTTP/1.0";
            case HttpVersion::HTTP_1_1: return "HTTP/1.1";
            default: return "HTTP/1.1";
        }
    }
};

/**
 * @brief Helper functions for HTTP method conversions
 */
class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        if (method_str == "OPTIONS") return HttpMethod::OPTIONS;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::OPTIONS: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }
};

} // namespace network
} // namespace mpu
