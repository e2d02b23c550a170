#pragma once

#include "mpu/client/relay_transport.hpp"
#include "mpu/core/result.hpp"
#include "mpu/storage/object_store.hpp"
#include "mpu/stream/byte_stream.hpp"
#include "mpu/upload/types.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace mpu::client {

struct UploadOptions {
    /// Extra attempts per part, spent only on NetworkError
    std::uint32_t part_retries = 0;

    /// Called with monotonically non-decreasing progress
    std::function<void(const upload::UploadProgress&)> on_progress;
};

/**
 * @brief Outcome of a successful upload
 */
struct UploadReport {
    std::string key;
    upload::UploadMode mode = upload::UploadMode::Simple;
    std::string upload_id;
    std::uint64_t bytes = 0;
    std::uint32_t part_count = 0;
    std::string etag;
    std::string message;
};

/**
 * @brief Caller-side driver for the relay's upload protocol
 *
 * upload() asks the relay for a plan, then either performs one direct put
 * (simple mode) or sends every planned byte range as its own part, in order.
 * Each part must come back with an ETag. Once all parts are in, the
 * collected ETags are submitted for completion.
 *
 * Any failure after a multipart session was opened, a failed completion
 * included, triggers a best-effort abort before the error is returned. The
 * returned error keeps its code and carries "Upload failed: <reason>".
 *
 * @code
 * auto transport = HttpRelayTransport::connect("http://127.0.0.1:8080");
 * UploadClient client(*transport.value());
 * auto report = client.upload("video.mp4", "videos/video.mp4");
 * @endcode
 */
class UploadClient {
public:
    explicit UploadClient(RelayTransport& transport, UploadOptions options = {});

    mpu::Result<UploadReport> upload(const std::filesystem::path& file, const std::string& key);

    mpu::Result<std::vector<storage::ObjectInfo>> list_objects();

    /**
     * @brief Stream an object into sink
     *
     * @return Bytes received
     */
    mpu::Result<std::uint64_t> download(const std::string& key, stream::ByteSink& sink);

private:
    mpu::Result<upload::UploadPlan> request_plan(const std::string& key, std::uint64_t size);
    /// Records the upload id in `opened` as soon as the relay reports one
    mpu::Result<upload::UploadPlan> request_plan_unchecked(const std::string& key,
                                                           std::uint64_t size,
                                                           upload::UploadPlan& opened);
    mpu::Result<std::vector<storage::ObjectInfo>> list_objects_unchecked();

    mpu::Result<UploadReport> upload_simple(const std::filesystem::path& file, const upload::UploadPlan& plan);

    mpu::Result<UploadReport> upload_multipart(const std::filesystem::path& file, const upload::UploadPlan& plan);

    mpu::Result<std::string> send_part(const std::filesystem::path& file,
                                       const upload::PartDescriptor& part,
                                       std::uint64_t total_size);

    mpu::Result<std::string> send_part_once(const std::filesystem::path& file,
                                            const upload::PartDescriptor& part,
                                            std::uint64_t total_size);

    mpu::Result<storage::ObjectInfo> complete(const upload::UploadPlan& plan,
                                              const std::vector<upload::CompletedPart>& parts);

    void abort_quietly(const upload::UploadPlan& plan);

    void report_progress(std::uint64_t loaded, std::uint64_t total);

    RelayTransport& transport_;
    UploadOptions options_;
    std::uint64_t last_reported_ = 0;
};

/**
 * @brief "Upload failed: <reason>" with the original error code
 */
Error upload_failed(const Error& cause);

} // namespace mpu::client
