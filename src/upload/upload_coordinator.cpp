#include "mpu/upload/upload_coordinator.hpp"

#include "mpu/util/encoding.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace mpu::upload {
namespace {

std::string join_numbers(const std::vector<std::uint32_t>& numbers, std::size_t limit) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < numbers.size() && i < limit; ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << numbers[i];
    }
    if (numbers.size() > limit) {
        oss << ", ... (" << numbers.size() << " total)";
    }
    return oss.str();
}

} // namespace

storage::ObjectMetadata CoordinatorOptions::default_multipart_metadata() {
    storage::ObjectMetadata metadata;
    metadata.content_type = storage::kDefaultContentType;
    metadata.cache_control = "no-cache";
    metadata.custom["upload-type"] = "multipart";
    return metadata;
}

UploadCoordinator::UploadCoordinator(storage::ObjectStoreAdapter& store,
                                     PartPlanner planner,
                                     CoordinatorOptions options)
    : store_(store),
      planner_(planner),
      options_(std::move(options)),
      session_(std::string{}, 0, options_.chunk_size) {}

std::unique_ptr<UploadCoordinator> UploadCoordinator::resume(storage::ObjectStoreAdapter& store,
                                                             PartPlanner planner,
                                                             CoordinatorOptions options,
                                                             const std::string& key,
                                                             const std::string& upload_id) {
    auto coordinator = std::make_unique<UploadCoordinator>(store, planner, std::move(options));
    coordinator->resumed_ = true;
    coordinator->session_ = UploadSession(key, 0, coordinator->options_.chunk_size);
    coordinator->session_.bind(UploadMode::Multipart, upload_id, 0);
    coordinator->plan_.key = key;
    coordinator->plan_.mode = UploadMode::Multipart;
    coordinator->plan_.upload_id = upload_id;
    coordinator->plan_.chunk_size = coordinator->options_.chunk_size;
    // Planning -> AwaitingParts is always legal on a fresh session
    (void)coordinator->session_.transition_to(UploadState::AwaitingParts);
    return coordinator;
}

std::string UploadCoordinator::part_url(const std::string& base_url,
                                        const std::string& key,
                                        const std::string& upload_id,
                                        std::uint32_t part_number) {
    return base_url + "/upload/part/" + util::percent_encode(key) +
           "?uploadId=" + util::percent_encode(upload_id) +
           "&partNumber=" + std::to_string(part_number);
}

std::string UploadCoordinator::simple_url(const std::string& base_url, const std::string& key) {
    return base_url + "/upload/simple/" + util::percent_encode(key);
}

mpu::Result<UploadPlan> UploadCoordinator::initiate(const std::string& key, std::uint64_t size) {
    if (key.empty()) {
        return mpu::Err<UploadPlan>(Error::validation("Object key must not be empty"));
    }

    {
        std::lock_guard lock(mutex_);
        if (session_.state() != UploadState::Planning || !session_.key().empty()) {
            return mpu::Err<UploadPlan>(Error::invalid_state("Upload already initiated for " + session_.key()));
        }
        session_ = UploadSession(key, size, options_.chunk_size);
    }

    auto planned = planner_.plan(size, options_.chunk_size);
    if (planned.is_error()) {
        std::lock_guard lock(mutex_);
        session_.set_error(planned.error().message);
        (void)session_.transition_to(UploadState::Aborted);
        return planned;
    }

    UploadPlan plan = std::move(planned.value());
    plan.key = key;

    if (plan.mode == UploadMode::Simple) {
        plan.upload_url = simple_url(options_.relay_base_url, key);
        std::lock_guard lock(mutex_);
        session_.bind(UploadMode::Simple, std::string{}, 0);
        plan_ = plan;
        return mpu::Ok(std::move(plan));
    }

    auto created = store_.create_multipart(key, options_.multipart_metadata);
    if (created.is_error()) {
        std::lock_guard lock(mutex_);
        session_.set_error(created.error().message);
        (void)session_.transition_to(UploadState::Aborted);
        return mpu::Err<UploadPlan>(created.error());
    }

    plan.upload_id = created.value();
    for (auto& part : plan.parts) {
        part.url = part_url(options_.relay_base_url, key, plan.upload_id, part.part_number);
    }

    std::lock_guard lock(mutex_);
    session_.bind(UploadMode::Multipart, plan.upload_id, plan.part_count());
    plan_ = plan;
    if (auto moved = session_.transition_to(UploadState::AwaitingParts); moved.is_error()) {
        return mpu::Err<UploadPlan>(moved.error());
    }
    spdlog::debug("Multipart upload {} opened for {} with {} parts", plan.upload_id, key, plan.part_count());
    return mpu::Ok(std::move(plan));
}

mpu::Result<void> UploadCoordinator::record_part(std::uint32_t part_number, const std::string& etag) {
    std::lock_guard lock(mutex_);

    if (session_.state() != UploadState::AwaitingParts) {
        return mpu::Err<void>(Error::invalid_state(std::string("Cannot record part while upload is ") +
                                                   to_string(session_.state())));
    }

    if (auto checked = check_part_number_locked(part_number); checked.is_error()) {
        return checked;
    }
    if (etag.empty()) {
        return mpu::Err<void>(Error::validation("Missing ETag for part " + std::to_string(part_number)));
    }

    parts_[part_number] = etag;
    session_.set_parts_recorded(static_cast<std::uint32_t>(parts_.size()));
    return mpu::Ok();
}

mpu::Result<void> UploadCoordinator::check_part_number(std::uint32_t part_number) const {
    std::lock_guard lock(mutex_);
    return check_part_number_locked(part_number);
}

mpu::Result<void> UploadCoordinator::check_part_number_locked(std::uint32_t part_number) const {
    const std::uint32_t upper = plan_known() ? plan_.part_count() : planner_.limits().max_parts;
    if (part_number < 1 || part_number > upper) {
        return mpu::Err<void>(Error::validation("Part number " + std::to_string(part_number) +
                                                " is outside the planned range 1.." + std::to_string(upper)));
    }
    return mpu::Ok();
}

std::vector<std::uint32_t> UploadCoordinator::missing_parts_locked() const {
    std::vector<std::uint32_t> missing;
    if (!plan_known()) {
        return missing;
    }
    for (const auto& part : plan_.parts) {
        if (parts_.find(part.part_number) == parts_.end()) {
            missing.push_back(part.part_number);
        }
    }
    return missing;
}

mpu::Result<storage::ObjectInfo> UploadCoordinator::complete() {
    std::vector<CompletedPart> sorted;
    std::string key;
    std::string upload_id;
    {
        std::lock_guard lock(mutex_);
        if (session_.info().mode != UploadMode::Multipart || session_.state() != UploadState::AwaitingParts) {
            return mpu::Err<storage::ObjectInfo>(Error::invalid_state(
                std::string("Cannot complete while upload is ") + to_string(session_.state())));
        }

        const auto missing = missing_parts_locked();
        if (!missing.empty()) {
            return mpu::Err<storage::ObjectInfo>(
                Error::validation("Cannot complete upload, missing parts: " + join_numbers(missing, 10)));
        }
        if (parts_.empty()) {
            return mpu::Err<storage::ObjectInfo>(Error::validation("Cannot complete upload without parts"));
        }

        // std::map iterates in ascending part order
        sorted.reserve(parts_.size());
        for (const auto& [number, etag] : parts_) {
            sorted.push_back(CompletedPart{number, etag});
        }
        key = session_.key();
        upload_id = session_.upload_id();

        if (auto moved = session_.transition_to(UploadState::Completing); moved.is_error()) {
            return mpu::Err<storage::ObjectInfo>(moved.error());
        }
    }

    auto result = store_.complete_multipart(key, upload_id, std::move(sorted));

    std::lock_guard lock(mutex_);
    if (session_.state() != UploadState::Completing) {
        // abort() won the race locally; the backend outcome stands as reported
        spdlog::warn("Upload {} changed to {} while completing", upload_id, to_string(session_.state()));
        return result;
    }
    if (result.is_error()) {
        session_.set_error(result.error().message);
        (void)session_.transition_to(UploadState::AwaitingParts);
        return result;
    }
    (void)session_.transition_to(UploadState::Done);
    return result;
}

mpu::Result<void> UploadCoordinator::mark_simple_complete() {
    std::lock_guard lock(mutex_);
    if (session_.info().mode != UploadMode::Simple || session_.key().empty()) {
        return mpu::Err<void>(Error::invalid_state("Upload is not a simple upload"));
    }
    return session_.transition_to(UploadState::Done);
}

mpu::Result<void> UploadCoordinator::abort() {
    std::string key;
    std::string upload_id;
    {
        std::lock_guard lock(mutex_);
        if (session_.is_terminal()) {
            return mpu::Ok();
        }
        key = session_.key();
        upload_id = session_.upload_id();
        if (auto moved = session_.transition_to(UploadState::Aborted); moved.is_error()) {
            return moved;
        }
    }

    if (upload_id.empty()) {
        return mpu::Ok();
    }

    auto released = store_.abort_multipart(key, upload_id);
    if (released.is_error()) {
        spdlog::warn("Backend failed to release parts of {}: {}", upload_id, released.error().message);
        std::lock_guard lock(mutex_);
        session_.set_error(released.error().message);
    }
    return released;
}

UploadState UploadCoordinator::state() const {
    std::lock_guard lock(mutex_);
    return session_.state();
}

UploadSessionInfo UploadCoordinator::info() const {
    std::lock_guard lock(mutex_);
    return session_.info();
}

UploadPlan UploadCoordinator::plan() const {
    std::lock_guard lock(mutex_);
    return plan_;
}

std::vector<CompletedPart> UploadCoordinator::completed_parts() const {
    std::lock_guard lock(mutex_);
    std::vector<CompletedPart> parts;
    parts.reserve(parts_.size());
    for (const auto& [number, etag] : parts_) {
        parts.push_back(CompletedPart{number, etag});
    }
    return parts;
}

std::vector<std::uint32_t> UploadCoordinator::missing_parts() const {
    std::lock_guard lock(mutex_);
    return missing_parts_locked();
}

} // namespace mpu::upload
