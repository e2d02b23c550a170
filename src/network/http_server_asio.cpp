#include "mpu/network/http_server_asio.hpp"

#include "mpu/network/http_router.hpp"

#include <spdlog/spdlog.h>

#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <vector>

namespace mpu {
namespace network {

// ──────────────────────────────────────────────────────────
// HttpConnection Implementation
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, HttpRequestHandler handler, size_t max_body_size)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , parser_(max_body_size) {
}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    spdlog::debug("Read error: {}", ec.message());
                }
                return;
            }

            auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);
            if (parse_result.is_error()) {
                handle_error(parse_result.error());
                return;
            }

            if (!parse_result.value()) {
                do_read();
                return;
            }

            HttpRequest request = parser_.take_request();

            spdlog::debug("{} {} ({} bytes)",
                HttpMethodUtils::to_string(request.method),
                request.url,
                request.body.size());

            HttpResponse response;
            try {
                response = handler_(request);
            } catch (const std::exception& e) {
                spdlog::error("Handler threw exception: {}", e.what());
                response = make_error_response(HttpStatus::INTERNAL_SERVER_ERROR,
                                               "Internal server error", e.what());
            }

            do_write(std::move(response));
        }
    );
}

void HttpConnection::do_write(HttpResponse response) {
    auto self = shared_from_this();

    // One request per connection
    response.set_header("Connection", "close");
    out_ = response.serialize();
    std::shared_ptr<stream::ByteSource> source = response.body_stream;

    asio::async_write(
        socket_,
        asio::buffer(out_),
        [this, self, source](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("Write error: {}", ec.message());
                }
                return;
            }

            spdlog::debug("Sent {} bytes", bytes_transferred);

            if (source) {
                do_pump(source);
            } else {
                close();
            }
        }
    );
}

void HttpConnection::do_pump(std::shared_ptr<stream::ByteSource> source) {
    auto self = shared_from_this();

    out_.resize(stream::kDefaultBufferSize);
    auto read = source->read(out_.data(), out_.size());
    if (read.is_error()) {
        // Head is already on the wire; the short body tells the client
        spdlog::error("Streamed body failed: {}", read.error().message);
        close();
        return;
    }
    if (read.value() == 0) {
        close();
        return;
    }
    out_.resize(read.value());

    asio::async_write(
        socket_,
        asio::buffer(out_),
        [this, self, source](boost::system::error_code ec, size_t) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("Write error while streaming: {}", ec.message());
                }
                return;
            }
            do_pump(source);
        }
    );
}

void HttpConnection::handle_error(const ParseError& error) {
    spdlog::warn("Rejecting request: {}", error.message);

    const char* title = error.status == HttpStatus::PAYLOAD_TOO_LARGE ? "Payload too large" : "Invalid request";
    do_write(make_error_response(error.status, title, error.message));
}

void HttpConnection::close() {
    boost::system::error_code shutdown_ec;
    socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
    if (shutdown_ec && shutdown_ec != asio::error::not_connected) {
        spdlog::debug("Shutdown error: {}", shutdown_ec.message());
    }
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio Implementation
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context,
                               const std::string& bind_address,
                               uint16_t port,
                               size_t max_body_size)
    : acceptor_(io_context, tcp::endpoint(asio::ip::make_address(bind_address), port))
    , max_body_size_(max_body_size)
    , port_(acceptor_.local_endpoint().port()) {

    spdlog::info("HTTP server listening on {}:{}", bind_address, port_);

    do_accept();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("Failed to close acceptor: {}", ec.message());
    }
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted) {
                return;
            }
            if (!ec) {
                spdlog::debug("Accepted connection from {}", socket.remote_endpoint(ec).address().to_string());
                std::make_shared<HttpConnection>(std::move(socket), handler_, max_body_size_)->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }

            do_accept();
        }
    );
}

mpu::Result<void> run_event_loop(asio::io_context& io_context, unsigned threads) {
    std::mutex mutex;
    std::optional<Error> failure;

    auto fail = [&](const std::string& reason) {
        spdlog::error("Event loop stopped: {}", reason);
        {
            std::lock_guard lock(mutex);
            if (!failure) {
                failure = Error::network("Event loop stopped: " + reason);
            }
        }
        io_context.stop();
    };

    auto run = [&]() {
        try {
            io_context.run();
        } catch (const std::exception& e) {
            fail(e.what());
        } catch (...) {
            fail("non-standard exception");
        }
    };

    std::vector<std::thread> workers;
    for (unsigned i = 1; i < threads; ++i) {
        try {
            workers.emplace_back(run);
        } catch (const std::system_error& e) {
            fail(std::string("cannot start worker thread: ") + e.what());
            break;
        }
    }

    run();
    for (auto& worker : workers) {
        worker.join();
    }

    if (failure) {
        return mpu::Err<void>(*failure);
    }
    return mpu::Ok();
}

} // namespace network
} // namespace mpu
