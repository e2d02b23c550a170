/**
 * @file components.hpp
 * @brief Event-driven logging and metrics
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 */

#pragma once

#include "mpu/events/event_bus.hpp"
#include "mpu/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <vector>

namespace mpu::events {

/**
 * @brief Logs every upload lifecycle event through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        subscriptions_.push_back(bus_.subscribe<ServerStartedEvent>([this](const ServerStartedEvent& e) {
            on_server_started(e);
        }));

        subscriptions_.push_back(bus_.subscribe<ServerShuttingDownEvent>([this](const ServerShuttingDownEvent& e) {
            on_server_shutdown(e);
        }));

        subscriptions_.push_back(bus_.subscribe<UploadInitiatedEvent>([this](const UploadInitiatedEvent& e) {
            on_upload_initiated(e);
        }));

        subscriptions_.push_back(bus_.subscribe<PartUploadedEvent>([this](const PartUploadedEvent& e) {
            on_part_uploaded(e);
        }));

        subscriptions_.push_back(bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            on_upload_completed(e);
        }));

        subscriptions_.push_back(bus_.subscribe<UploadAbortedEvent>([this](const UploadAbortedEvent& e) {
            on_upload_aborted(e);
        }));

        subscriptions_.push_back(bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            on_upload_failed(e);
        }));

        subscriptions_.push_back(bus_.subscribe<ObjectDownloadedEvent>([this](const ObjectDownloadedEvent& e) {
            on_object_downloaded(e);
        }));
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    void on_server_started(const ServerStartedEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Relay started on port {} (backend: {})", e.port, e.backend);
        spdlog::info("════════════════════════════════════════════");
    }

    void on_server_shutdown(const ServerShuttingDownEvent& e) {
        spdlog::info("Relay shutting down: {}", e.reason);
    }

    void on_upload_initiated(const UploadInitiatedEvent& e) {
        spdlog::info("[UploadInitiated] key={} mode={} upload_id={} bytes={} parts={}",
                     e.key, upload::to_string(e.mode), e.upload_id, e.total_bytes, e.part_count);
    }

    void on_part_uploaded(const PartUploadedEvent& e) {
        spdlog::debug("[PartUploaded] key={} upload_id={} part={} bytes={} etag={}",
                      e.key, e.upload_id, e.part_number, e.bytes, e.etag);
    }

    void on_upload_completed(const UploadCompletedEvent& e) {
        spdlog::info("[UploadCompleted] key={} mode={} bytes={} parts={} etag={} duration={}ms",
                     e.key, upload::to_string(e.mode), e.total_bytes, e.part_count, e.etag, e.duration.count());
    }

    void on_upload_aborted(const UploadAbortedEvent& e) {
        if (e.backend_error.empty()) {
            spdlog::info("[UploadAborted] key={} upload_id={}", e.key, e.upload_id);
        } else {
            spdlog::warn("[UploadAborted] key={} upload_id={} backend_error={}", e.key, e.upload_id, e.backend_error);
        }
    }

    void on_upload_failed(const UploadFailedEvent& e) {
        spdlog::error("[UploadFailed] key={} upload_id={} stage={} error={}",
                      e.key, e.upload_id, e.stage, e.error_message);
    }

    void on_object_downloaded(const ObjectDownloadedEvent& e) {
        spdlog::info("[ObjectDownloaded] key={} bytes={}", e.key, e.total_bytes);
    }

    EventBus& bus_;
    std::vector<Subscription> subscriptions_;
};

/**
 * @brief Counts uploads, parts and bytes for monitoring
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> uploads_initiated{0};
        std::atomic<uint64_t> multipart_initiated{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> uploads_aborted{0};
        std::atomic<uint64_t> uploads_failed{0};
        std::atomic<uint64_t> parts_uploaded{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> objects_downloaded{0};
        std::atomic<uint64_t> bytes_downloaded{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        subscriptions_.push_back(bus_.subscribe<UploadInitiatedEvent>([this](const UploadInitiatedEvent& e) {
            stats_.uploads_initiated++;
            if (e.mode == upload::UploadMode::Multipart) {
                stats_.multipart_initiated++;
            }
        }));

        subscriptions_.push_back(bus_.subscribe<PartUploadedEvent>([this](const PartUploadedEvent& e) {
            stats_.parts_uploaded++;
            stats_.bytes_uploaded += e.bytes;
        }));

        subscriptions_.push_back(bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            stats_.uploads_completed++;
            // Multipart bytes were already counted part by part
            if (e.mode == upload::UploadMode::Simple) {
                stats_.bytes_uploaded += e.total_bytes;
            }
        }));

        subscriptions_.push_back(bus_.subscribe<UploadAbortedEvent>([this](const UploadAbortedEvent&) {
            stats_.uploads_aborted++;
        }));

        subscriptions_.push_back(bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent&) {
            stats_.uploads_failed++;
        }));

        subscriptions_.push_back(bus_.subscribe<ObjectDownloadedEvent>([this](const ObjectDownloadedEvent& e) {
            stats_.objects_downloaded++;
            stats_.bytes_downloaded += e.total_bytes;
        }));
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Relay Statistics:");
        spdlog::info("  Uploads initiated:  {}", stats_.uploads_initiated.load());
        spdlog::info("  Multipart uploads:  {}", stats_.multipart_initiated.load());
        spdlog::info("  Uploads completed:  {}", stats_.uploads_completed.load());
        spdlog::info("  Uploads aborted:    {}", stats_.uploads_aborted.load());
        spdlog::info("  Failures:           {}", stats_.uploads_failed.load());
        spdlog::info("  Parts uploaded:     {}", stats_.parts_uploaded.load());
        spdlog::info("  Bytes uploaded:     {}", stats_.bytes_uploaded.load());
        spdlog::info("  Objects downloaded: {}", stats_.objects_downloaded.load());
        spdlog::info("  Bytes downloaded:   {}", stats_.bytes_downloaded.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
    std::vector<Subscription> subscriptions_;
};

} // namespace mpu::events
