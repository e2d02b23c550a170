#include "mpu/upload/upload_session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace mpu::upload {
namespace {

bool is_allowed(UploadState current, UploadState target) {
    static const std::unordered_map<UploadState, std::vector<UploadState>> transitions {
        {UploadState::Planning, {UploadState::AwaitingParts, UploadState::Done, UploadState::Aborted}},
        {UploadState::AwaitingParts, {UploadState::Completing, UploadState::Aborted}},
        {UploadState::Completing, {UploadState::Done, UploadState::AwaitingParts, UploadState::Aborted}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

UploadSession::UploadSession(std::string key, std::uint64_t total_size, std::uint64_t chunk_size) {
    info_.key = std::move(key);
    info_.total_size = total_size;
    info_.chunk_size = chunk_size;
    info_.state = UploadState::Planning;
    info_.started_at = std::chrono::system_clock::now();
    last_transition_ = info_.started_at;
}

void UploadSession::bind(UploadMode mode, std::string upload_id, std::uint32_t part_count) {
    info_.mode = mode;
    info_.upload_id = std::move(upload_id);
    info_.part_count = part_count;
}

mpu::Result<void> UploadSession::transition_to(UploadState next_state) {
    if (info_.state == next_state) {
        return mpu::Ok();
    }

    if (!can_transition(next_state)) {
        return mpu::Err<void>(Error::invalid_state(std::string("Illegal upload state transition from ") +
                                                   to_string(info_.state) + " to " + to_string(next_state)));
    }

    info_.state = next_state;
    last_transition_ = std::chrono::system_clock::now();
    return mpu::Ok();
}

bool UploadSession::can_transition(UploadState target) const noexcept {
    if (info_.state == target) {
        return true;
    }

    if (is_terminal()) {
        return false;
    }

    return is_allowed(info_.state, target);
}

} // namespace mpu::upload
