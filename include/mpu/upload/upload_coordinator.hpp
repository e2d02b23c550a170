#pragma once

#include "mpu/core/result.hpp"
#include "mpu/storage/object_store.hpp"
#include "mpu/upload/part_planner.hpp"
#include "mpu/upload/types.hpp"
#include "mpu/upload/upload_session.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mpu::upload {

struct CoordinatorOptions {
    std::uint64_t chunk_size = kDefaultChunkSize;

    /// Prefix for generated part/simple URLs, e.g. "http://relay:8080"; empty yields relative URLs
    std::string relay_base_url;

    /// Metadata handed to create_multipart
    storage::ObjectMetadata multipart_metadata = default_multipart_metadata();

    static storage::ObjectMetadata default_multipart_metadata();
};

/**
 * @brief Drives the protocol for one upload
 *
 * initiate() plans the upload and, for multipart mode, opens the backend
 * session and assigns one relay URL per part. record_part() accepts ETags in
 * any order and from any thread. complete() submits the parts sorted by
 * number once every planned part is present; a failed completion leaves the
 * session retryable and never aborts on its own. abort() is best effort and
 * idempotent.
 *
 * The internal lock guards only the coordinator's own bookkeeping. Backend
 * calls run unlocked, so concurrent complete()/abort() on one session are
 * decided by the backend.
 */
class UploadCoordinator {
public:
    UploadCoordinator(storage::ObjectStoreAdapter& store,
                      PartPlanner planner,
                      CoordinatorOptions options = {});

    UploadCoordinator(const UploadCoordinator&) = delete;
    UploadCoordinator& operator=(const UploadCoordinator&) = delete;

    /**
     * @brief Rebuild a coordinator for a multipart session nobody tracks anymore
     *
     * The planned part count is unknown, so record_part() accepts any number
     * within the planner's max_parts and completeness is left to the backend.
     */
    static std::unique_ptr<UploadCoordinator> resume(storage::ObjectStoreAdapter& store,
                                                     PartPlanner planner,
                                                     CoordinatorOptions options,
                                                     const std::string& key,
                                                     const std::string& upload_id);

    mpu::Result<UploadPlan> initiate(const std::string& key, std::uint64_t size);

    mpu::Result<void> record_part(std::uint32_t part_number, const std::string& etag);

    /// ValidationError unless part_number is within the planned range
    mpu::Result<void> check_part_number(std::uint32_t part_number) const;

    mpu::Result<storage::ObjectInfo> complete();

    /// Simple mode: the client reports that its direct put succeeded
    mpu::Result<void> mark_simple_complete();

    mpu::Result<void> abort();

    [[nodiscard]] UploadState state() const;
    [[nodiscard]] UploadSessionInfo info() const;
    [[nodiscard]] UploadPlan plan() const;

    /// Recorded parts, ascending by part number
    [[nodiscard]] std::vector<CompletedPart> completed_parts() const;

    /// False for a coordinator rebuilt by resume()
    [[nodiscard]] bool plan_known() const noexcept { return !resumed_; }

    /// Planned part numbers that have no recorded ETag yet
    [[nodiscard]] std::vector<std::uint32_t> missing_parts() const;

    static std::string part_url(const std::string& base_url,
                                const std::string& key,
                                const std::string& upload_id,
                                std::uint32_t part_number);

    static std::string simple_url(const std::string& base_url, const std::string& key);

private:
    std::vector<std::uint32_t> missing_parts_locked() const;
    mpu::Result<void> check_part_number_locked(std::uint32_t part_number) const;

    storage::ObjectStoreAdapter& store_;
    PartPlanner planner_;
    CoordinatorOptions options_;

    mutable std::mutex mutex_;
    UploadSession session_;
    UploadPlan plan_;
    std::map<std::uint32_t, std::string> parts_;
    bool resumed_ = false;
};

} // namespace mpu::upload
