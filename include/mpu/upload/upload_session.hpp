#pragma once

#include "mpu/core/result.hpp"
#include "mpu/upload/types.hpp"

#include <chrono>
#include <string>

namespace mpu::upload {

/**
 * @brief Protocol state of one upload
 *
 * Planning -> AwaitingParts -> Completing -> Done, with Aborted reachable
 * from Planning, AwaitingParts and Completing. A failed completion returns to
 * AwaitingParts so that complete() may be retried. Simple uploads go from
 * Planning straight to Done.
 */
class UploadSession {
public:
    UploadSession(std::string key, std::uint64_t total_size, std::uint64_t chunk_size);

    [[nodiscard]] const std::string& key() const noexcept { return info_.key; }
    [[nodiscard]] const std::string& upload_id() const noexcept { return info_.upload_id; }
    [[nodiscard]] UploadState state() const noexcept { return info_.state; }
    [[nodiscard]] const UploadSessionInfo& info() const noexcept { return info_; }
    [[nodiscard]] bool is_terminal() const noexcept {
        return info_.state == UploadState::Done || info_.state == UploadState::Aborted;
    }

    void bind(UploadMode mode, std::string upload_id, std::uint32_t part_count);
    void set_parts_recorded(std::uint32_t count) noexcept { info_.parts_recorded = count; }

    mpu::Result<void> transition_to(UploadState next_state);
    void set_error(std::string message) { info_.last_error = std::move(message); }

    [[nodiscard]] std::chrono::system_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    [[nodiscard]] bool can_transition(UploadState target) const noexcept;

    UploadSessionInfo info_;
    std::chrono::system_clock::time_point last_transition_{};
};

} // namespace mpu::upload
