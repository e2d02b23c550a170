#pragma once

#include "mpu/core/result.hpp"
#include "mpu/network/http_parser.hpp"
#include "mpu/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <functional>
#include <memory>
#include <string>

namespace mpu {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Per-connection handler for async HTTP requests
 *
 * Each accepted connection gets its own HttpConnection object that manages
 * the async I/O for that connection. Uses enable_shared_from_this to keep
 * the connection alive while async operations are pending.
 *
 * Lifecycle:
 * 1. Created when connection is accepted
 * 2. start() begins async read operation
 * 3. The parsed request is handed to the handler
 * 4. The head is written, then the body (in memory or pumped from a stream)
 * 5. Destroyed once the socket is shut down
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler, size_t max_body_size);

    void start();

private:
    void do_read();

    void do_write(HttpResponse response);

    /**
     * @brief Write the next chunk of a streamed body
     */
    void do_pump(std::shared_ptr<stream::ByteSource> source);

    void handle_error(const ParseError& error);

    void close();

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 8192> buffer_;
    std::vector<uint8_t> out_;
};

/**
 * @brief Event-driven HTTP server using Boost.Asio
 *
 * Thread safety:
 * - io_context.run() may be called from several threads
 * - The handler is called from io_context thread(s) and must be thread-safe
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, "0.0.0.0", 8080, 11 * 1024 * 1024);
 * server.set_handler([&router](const HttpRequest& req) {
 *     return router.handle_request(req);
 * });
 * io_context.run();
 * ```
 */
class HttpServerAsio {
public:
    /**
     * @param io_context Boost.Asio event loop (must outlive this server)
     * @param bind_address Address to listen on
     * @param port Port to listen on, 0 picks an ephemeral port
     * @param max_body_size Larger requests are answered with 413
     */
    HttpServerAsio(asio::io_context& io_context,
                   const std::string& bind_address,
                   uint16_t port,
                   size_t max_body_size = HttpParser::kUnlimited);

    void set_handler(HttpRequestHandler handler);

    /**
     * @brief Port actually bound, useful when 0 was requested
     */
    uint16_t get_port() const { return port_; }

    /**
     * @brief Stop accepting new connections
     */
    void stop();

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    size_t max_body_size_;
    uint16_t port_;
};

/**
 * @brief Run io_context on `threads` threads, the caller's included
 *
 * Returns once the loop has stopped and every worker has been joined. An
 * exception escaping a completion handler stops the loop on all threads and
 * the first one is returned as a NetworkError.
 */
mpu::Result<void> run_event_loop(asio::io_context& io_context, unsigned threads);

} // namespace network
} // namespace mpu
