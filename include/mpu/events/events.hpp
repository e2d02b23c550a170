/**
 * @file events.hpp
 * @brief Upload lifecycle events
 *
 * NAMING CONVENTION:
 * Events are past-tense: UploadInitiatedEvent, PartUploadedEvent. Each
 * carries a kName without the Event suffix for log lines.
 */

#pragma once

#include "mpu/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace mpu::events {

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

struct ServerStartedEvent {
    static constexpr const char* kName = "ServerStarted";

    uint16_t port;
    std::string backend;
    std::chrono::system_clock::time_point timestamp;

    ServerStartedEvent(uint16_t p, std::string b)
        : port(p),
          backend(std::move(b)),
          timestamp(std::chrono::system_clock::now())
    {}
};

struct ServerShuttingDownEvent {
    static constexpr const char* kName = "ServerShuttingDown";

    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerShuttingDownEvent(std::string r = "normal")
        : reason(std::move(r)),
          timestamp(std::chrono::system_clock::now())
    {}
};

// ════════════════════════════════════════════════════════
// Upload Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once a plan exists (and, for multipart, the backend session)
 *
 * WHO EMITS: relay initiate route
 * WHO SUBSCRIBES: logger, metrics
 */
struct UploadInitiatedEvent {
    static constexpr const char* kName = "UploadInitiated";

    std::string key;
    std::string upload_id;
    upload::UploadMode mode = upload::UploadMode::Simple;
    std::uint64_t total_bytes = 0;
    std::uint32_t part_count = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted after the backend accepted one part
 */
struct PartUploadedEvent {
    static constexpr const char* kName = "PartUploaded";

    std::string key;
    std::string upload_id;
    std::uint32_t part_number = 0;
    std::size_t bytes = 0;
    std::string etag;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when an object became durable (simple put or completed multipart)
 */
struct UploadCompletedEvent {
    static constexpr const char* kName = "UploadCompleted";

    std::string key;
    std::string upload_id;
    upload::UploadMode mode = upload::UploadMode::Simple;
    std::uint64_t total_bytes = 0;
    std::uint32_t part_count = 0;
    std::string etag;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadAbortedEvent {
    static constexpr const char* kName = "UploadAborted";

    std::string key;
    std::string upload_id;
    std::string backend_error;   ///< Empty when the backend released the parts cleanly
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted for any failed protocol step; `stage` names the step
 */
struct UploadFailedEvent {
    static constexpr const char* kName = "UploadFailed";

    std::string key;
    std::string upload_id;
    std::string stage;           ///< "initiate", "part", "complete", "simple"
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ObjectDownloadedEvent {
    static constexpr const char* kName = "ObjectDownloaded";

    std::string key;
    std::uint64_t total_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace mpu::events
