#pragma once

#include "mpu/core/result.hpp"
#include "mpu/network/http_client.hpp"
#include "mpu/network/http_router.hpp"
#include "mpu/network/http_types.hpp"
#include "mpu/stream/byte_stream.hpp"

#include <memory>
#include <string>

namespace mpu::client {

/**
 * @brief How UploadClient reaches a relay
 *
 * send() returns the relay's response whatever its status; only transport
 * failures are errors (ErrorCode::Network). Targets are paths relative to the
 * relay root, e.g. "/upload/initiate".
 */
class RelayTransport {
public:
    virtual ~RelayTransport() = default;

    virtual mpu::Result<network::HttpResponse> send(const network::ClientRequest& request,
                                                    stream::ByteSink* body_sink = nullptr) = 0;

    /**
     * @brief Turn a URL handed out by the relay into a request target
     *
     * Absolute http:// URLs lose their scheme and authority; relative ones
     * are returned unchanged.
     */
    virtual std::string target_for(const std::string& url) const;
};

/**
 * @brief Talks to a relay over HTTP
 */
class HttpRelayTransport : public RelayTransport {
public:
    explicit HttpRelayTransport(network::HttpEndpoint endpoint);

    static mpu::Result<std::unique_ptr<HttpRelayTransport>> connect(const std::string& base_url);

    mpu::Result<network::HttpResponse> send(const network::ClientRequest& request,
                                            stream::ByteSink* body_sink = nullptr) override;

    /// Also strips the endpoint's base path so it is not applied twice
    std::string target_for(const std::string& url) const override;

private:
    network::HttpClient client_;
};

/**
 * @brief Dispatches straight into an HttpRouter in the same process
 *
 * The request body is read fully into memory, as the server's parser would
 * buffer it, and streamed response bodies are pumped into the sink.
 */
class RouterTransport : public RelayTransport {
public:
    explicit RouterTransport(network::HttpRouter& router);

    mpu::Result<network::HttpResponse> send(const network::ClientRequest& request,
                                            stream::ByteSink* body_sink = nullptr) override;

private:
    network::HttpRouter& router_;
};

} // namespace mpu::client
