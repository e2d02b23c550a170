#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mpu::upload {

inline constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;

/// Part size shared by the client and the relay.
inline constexpr std::uint64_t kDefaultChunkSize = 10 * kMiB;
/// Smallest part the backend accepts (except for the last part).
inline constexpr std::uint64_t kMinPartSize = 5 * kMiB;
/// Largest part count the backend accepts for one upload.
inline constexpr std::uint32_t kMaxParts = 10000;

enum class UploadMode {
    Simple,
    Multipart
};

enum class UploadState {
    Planning,
    AwaitingParts,
    Completing,
    Done,
    Aborted
};

/**
 * @brief One planned part of a multipart upload
 *
 * Byte range is half-open: [start, end).
 */
struct PartDescriptor {
    std::uint32_t part_number = 0;
    std::uint64_t start = 0;
    std::uint64_t end = 0;
    std::string url; ///< Relay target, filled in by the coordinator

    [[nodiscard]] std::uint64_t size() const noexcept { return end - start; }
};

/**
 * @brief Result of a successful part upload
 */
struct CompletedPart {
    std::uint32_t part_number = 0;
    std::string etag;
};

/**
 * @brief Output of the planner, enriched by the coordinator
 */
struct UploadPlan {
    std::string key;
    UploadMode mode = UploadMode::Simple;
    std::uint64_t total_size = 0;
    std::uint64_t chunk_size = 0;
    std::string upload_id;                   ///< Multipart only
    std::string upload_url;                  ///< Simple only
    std::vector<PartDescriptor> parts;       ///< Empty for simple mode

    [[nodiscard]] std::uint32_t part_count() const noexcept {
        return static_cast<std::uint32_t>(parts.size());
    }
};

/**
 * @brief Client-local transfer progress
 */
struct UploadProgress {
    std::uint64_t loaded = 0;
    std::uint64_t total = 0;
    int percentage = 0;
};

/**
 * @brief Snapshot of a coordinator's session for logging and status queries
 */
struct UploadSessionInfo {
    std::string key;
    std::string upload_id;
    UploadMode mode = UploadMode::Simple;
    UploadState state = UploadState::Planning;
    std::uint64_t total_size = 0;
    std::uint64_t chunk_size = 0;
    std::uint32_t part_count = 0;
    std::uint32_t parts_recorded = 0;
    std::chrono::system_clock::time_point started_at{};
    std::string last_error;
};

const char* to_string(UploadMode mode) noexcept;
const char* to_string(UploadState state) noexcept;
std::optional<UploadMode> parse_upload_mode(const std::string& text) noexcept;

UploadProgress make_progress(std::uint64_t loaded, std::uint64_t total) noexcept;

} // namespace mpu::upload
