#pragma once

#include "mpu/core/result.hpp"
#include "mpu/events/event_bus.hpp"
#include "mpu/network/http_router.hpp"
#include "mpu/storage/object_store.hpp"
#include "mpu/upload/part_planner.hpp"
#include "mpu/upload/types.hpp"
#include "mpu/upload/upload_coordinator.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mpu::relay {

struct RelayOptions {
    std::uint64_t chunk_size = upload::kDefaultChunkSize;

    /// Prefix for the URLs handed to clients; empty yields relative URLs
    std::string public_url;

    upload::PlannerLimits limits;

    /// Tracked multipart uploads idle this long are aborted by the next initiate
    std::chrono::seconds idle_timeout{std::chrono::hours(24)};
};

/**
 * @brief The relay's HTTP surface over one object store
 *
 * Keeps one UploadCoordinator per in-flight multipart upload, keyed by upload
 * id, and drops it once the upload completes, is aborted, or sits idle past
 * RelayOptions::idle_timeout. Requests for an upload id the relay does not
 * track (for example after a restart) resume a coordinator from the key and
 * id the client presents. A resumed coordinator is tracked only once the
 * backend accepts a part for it, so unknown ids never occupy the registry.
 *
 * The operations are usable directly; register_routes() binds them to:
 *
 *   POST /upload/initiate
 *   PUT  /upload/part/<key>?uploadId=..&partNumber=..
 *   PUT  /upload/simple/<key>
 *   POST /upload/complete
 *   POST /upload/abort
 *   GET  /objects
 *   GET  /objects/<key>
 *   OPTIONS *
 *
 * Every response, errors included, carries the CORS headers.
 */
class RelayService {
public:
    RelayService(storage::ObjectStoreAdapter& store, events::EventBus& bus, RelayOptions options);

    RelayService(const RelayService&) = delete;
    RelayService& operator=(const RelayService&) = delete;

    void register_routes(network::HttpRouter& router);

    mpu::Result<upload::UploadPlan> initiate(const std::string& key, std::uint64_t size);

    mpu::Result<std::string> upload_part(const std::string& key,
                                         const std::string& upload_id,
                                         std::uint32_t part_number,
                                         const std::vector<std::uint8_t>& bytes);

    mpu::Result<std::string> upload_simple(const std::string& key, const std::vector<std::uint8_t>& bytes);

    mpu::Result<storage::ObjectInfo> complete(const std::string& key,
                                              const std::string& upload_id,
                                              const std::vector<upload::CompletedPart>& parts);

    mpu::Result<void> abort(const std::string& key, const std::string& upload_id);

    /// Number of multipart uploads with a live coordinator
    std::size_t active_uploads() const;

    /**
     * @brief Abort tracked uploads with no activity for idle_timeout
     *
     * @return Number of uploads expired
     */
    std::size_t expire_idle_uploads();

    /**
     * @brief Headers attached to every relay response
     */
    static void apply_cors(network::HttpResponse& response);

    /**
     * @brief attachment; filename*=UTF-8''<percent-encoded key>
     */
    static std::string content_disposition(const std::string& key);

    static network::HttpStatus status_for(ErrorCode code);

private:
    struct ActiveUpload {
        std::shared_ptr<upload::UploadCoordinator> coordinator;
        std::chrono::steady_clock::time_point started_at{std::chrono::steady_clock::now()};
        std::chrono::steady_clock::time_point last_activity{started_at};
        std::uint64_t total_bytes = 0;
    };

    struct Lookup {
        std::shared_ptr<upload::UploadCoordinator> coordinator;
        bool tracked = false;
    };

    /// Tracked coordinator for upload_id, or an untracked resumed one
    mpu::Result<Lookup> find_or_resume(const std::string& key, const std::string& upload_id);

    /// Registers coordinator unless upload_id is already tracked; returns the tracked one
    std::shared_ptr<upload::UploadCoordinator> track(const std::string& upload_id,
                                                     std::shared_ptr<upload::UploadCoordinator> coordinator);

    void forget(const std::string& upload_id);

    upload::CoordinatorOptions coordinator_options() const;

    network::HttpResponse handle_initiate(const network::HttpContext& ctx);
    network::HttpResponse handle_part(const network::HttpContext& ctx);
    network::HttpResponse handle_simple(const network::HttpContext& ctx);
    network::HttpResponse handle_complete(const network::HttpContext& ctx);
    network::HttpResponse handle_abort(const network::HttpContext& ctx);
    network::HttpResponse handle_list(const network::HttpContext& ctx);
    network::HttpResponse handle_download(const network::HttpContext& ctx);

    void emit_failure(const std::string& key,
                      const std::string& upload_id,
                      const std::string& stage,
                      const Error& error);

    storage::ObjectStoreAdapter& store_;
    events::EventBus& event_bus_;
    RelayOptions options_;
    upload::PartPlanner planner_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ActiveUpload> uploads_;
};

} // namespace mpu::relay
