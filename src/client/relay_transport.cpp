#include "mpu/client/relay_transport.hpp"

#include <spdlog/spdlog.h>

namespace mpu::client {

std::string RelayTransport::target_for(const std::string& url) const {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return url;
    }
    auto slash = url.find('/', scheme.size());
    return slash == std::string::npos ? "/" : url.substr(slash);
}

// ──────────────────────────────────────────────────────────
// HttpRelayTransport
// ──────────────────────────────────────────────────────────

HttpRelayTransport::HttpRelayTransport(network::HttpEndpoint endpoint)
    : client_(std::move(endpoint)) {}

mpu::Result<std::unique_ptr<HttpRelayTransport>> HttpRelayTransport::connect(const std::string& base_url) {
    auto endpoint = network::HttpEndpoint::parse(base_url);
    if (endpoint.is_error()) {
        return mpu::Err<std::unique_ptr<HttpRelayTransport>>(endpoint.error());
    }
    return mpu::Ok(std::make_unique<HttpRelayTransport>(std::move(endpoint.value())));
}

mpu::Result<network::HttpResponse> HttpRelayTransport::send(const network::ClientRequest& request,
                                                            stream::ByteSink* body_sink) {
    return client_.send(request, body_sink);
}

std::string HttpRelayTransport::target_for(const std::string& url) const {
    std::string target = RelayTransport::target_for(url);
    const std::string& base = client_.endpoint().base_path;
    if (!base.empty() && target.compare(0, base.size(), base) == 0) {
        target = target.substr(base.size());
    }
    return target;
}

// ──────────────────────────────────────────────────────────
// RouterTransport
// ──────────────────────────────────────────────────────────

RouterTransport::RouterTransport(network::HttpRouter& router)
    : router_(router) {}

mpu::Result<network::HttpResponse> RouterTransport::send(const network::ClientRequest& request,
                                                         stream::ByteSink* body_sink) {
    network::HttpRequest http_request;
    http_request.method = request.method;
    http_request.url = request.target;
    http_request.headers = request.headers;

    if (request.body) {
        http_request.headers["Content-Length"] = std::to_string(request.body_length);
        http_request.body.reserve(static_cast<size_t>(request.body_length));

        std::vector<uint8_t> chunk(stream::kDefaultBufferSize);
        while (http_request.body.size() < request.body_length) {
            auto read = request.body->read(chunk.data(), chunk.size());
            if (read.is_error()) {
                return mpu::Err<network::HttpResponse>(read.error());
            }
            if (read.value() == 0) {
                return mpu::Err<network::HttpResponse>(Error::io("Request body ended after " +
                    std::to_string(http_request.body.size()) + " of " +
                    std::to_string(request.body_length) + " bytes"));
            }
            http_request.body.insert(http_request.body.end(), chunk.begin(), chunk.begin() + read.value());
            if (request.on_sent) {
                request.on_sent(http_request.body.size());
            }
        }
    }

    network::HttpResponse response = router_.handle_request(http_request);
    const bool success = response.status_code >= 200 && response.status_code < 300;
    if (!success) {
        body_sink = nullptr;
    }

    if (response.is_streamed()) {
        auto source = std::move(response.body_stream);
        if (body_sink) {
            auto piped = stream::pipe(*source, *body_sink);
            if (piped.is_error()) {
                return mpu::Err<network::HttpResponse>(piped.error());
            }
            if (auto closed = body_sink->close(); closed.is_error()) {
                return mpu::Err<network::HttpResponse>(closed.error());
            }
        } else {
            stream::VectorSink collect(response.body);
            auto piped = stream::pipe(*source, collect);
            if (piped.is_error()) {
                return mpu::Err<network::HttpResponse>(piped.error());
            }
        }
    } else if (body_sink && !response.body.empty()) {
        if (auto written = body_sink->write(response.body.data(), response.body.size()); written.is_error()) {
            return mpu::Err<network::HttpResponse>(written.error());
        }
        if (auto closed = body_sink->close(); closed.is_error()) {
            return mpu::Err<network::HttpResponse>(closed.error());
        }
        response.body.clear();
    }

    spdlog::debug("{} {} -> {}", network::HttpMethodUtils::to_string(request.method), request.target,
                  response.status_code);
    return mpu::Ok(std::move(response));
}

} // namespace mpu::client
