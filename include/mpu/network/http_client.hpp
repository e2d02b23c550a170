#pragma once

#include "mpu/core/result.hpp"
#include "mpu/network/http_types.hpp"
#include "mpu/stream/byte_stream.hpp"

#include <boost/asio.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace mpu {
namespace network {

/**
 * @brief Parsed "http://host[:port][/prefix]" base URL
 */
struct HttpEndpoint {
    std::string host;
    uint16_t port = 80;
    std::string base_path;  // Without trailing slash, may be empty

    static Result<HttpEndpoint> parse(const std::string& url);

    std::string to_string() const;
};

/**
 * @brief Outgoing request for HttpClient
 *
 * The body is either absent or a source yielding exactly body_length bytes.
 * on_sent reports cumulative body bytes written to the socket.
 */
struct ClientRequest {
    HttpMethod method = HttpMethod::GET;
    std::string target;  // Path and query, appended to the endpoint's base path
    std::unordered_map<std::string, std::string> headers;
    std::shared_ptr<stream::ByteSource> body;
    uint64_t body_length = 0;
    std::function<void(uint64_t sent)> on_sent;
};

/**
 * @brief Blocking HTTP/1.1 client on Boost.Asio
 *
 * One connection per request, matching the relay's Connection: close.
 * Transport failures (resolve, connect, short reads) come back as
 * ErrorCode::Network; HTTP error statuses are returned as responses and left
 * to the caller. Responses without Content-Length are read until EOF.
 *
 * Not thread-safe; use one client per thread.
 */
class HttpClient {
public:
    explicit HttpClient(HttpEndpoint endpoint);

    /**
     * @param request Request to send
     * @param body_sink When set, a 2xx response body is streamed here instead
     *                  of being stored in HttpResponse::body
     */
    Result<HttpResponse> send(const ClientRequest& request, stream::ByteSink* body_sink = nullptr);

    const HttpEndpoint& endpoint() const { return endpoint_; }

private:
    Result<void> write_request(boost::asio::ip::tcp::socket& socket, const ClientRequest& request);

    Result<HttpResponse> read_response(boost::asio::ip::tcp::socket& socket,
                                       bool head_only,
                                       stream::ByteSink* body_sink);

    HttpEndpoint endpoint_;
    boost::asio::io_context io_context_;
};

} // namespace network
} // namespace mpu
