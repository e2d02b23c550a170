#include "mpu/upload/types.hpp"

namespace mpu::upload {

const char* to_string(UploadMode mode) noexcept {
    switch (mode) {
        case UploadMode::Simple: return "simple";
        case UploadMode::Multipart: return "multipart";
    }
    return "unknown";
}

const char* to_string(UploadState state) noexcept {
    switch (state) {
        case UploadState::Planning: return "planning";
        case UploadState::AwaitingParts: return "awaiting_parts";
        case UploadState::Completing: return "completing";
        case UploadState::Done: return "done";
        case UploadState::Aborted: return "aborted";
    }
    return "unknown";
}

std::optional<UploadMode> parse_upload_mode(const std::string& text) noexcept {
    if (text == "simple") {
        return UploadMode::Simple;
    }
    if (text == "multipart") {
        return UploadMode::Multipart;
    }
    return std::nullopt;
}

UploadProgress make_progress(std::uint64_t loaded, std::uint64_t total) noexcept {
    UploadProgress progress;
    progress.loaded = loaded;
    progress.total = total;
    if (total == 0) {
        progress.percentage = 100;
    } else {
        // Rounded half up
        progress.percentage = static_cast<int>((loaded * 200 + total) / (total * 2));
    }
    return progress;
}

} // namespace mpu::upload
