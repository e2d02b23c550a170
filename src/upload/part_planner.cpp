#include "mpu/upload/part_planner.hpp"

#include <algorithm>
#include <string>

namespace mpu::upload {

std::uint64_t PartPlanner::part_count_for(std::uint64_t file_size, std::uint64_t chunk_size) noexcept {
    if (chunk_size == 0) {
        return 0;
    }
    return file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0);
}

mpu::Result<UploadPlan> PartPlanner::plan(std::uint64_t file_size, std::uint64_t chunk_size) const {
    if (chunk_size == 0) {
        return mpu::Err<UploadPlan>(Error::config("Chunk size must be greater than zero"));
    }

    UploadPlan plan;
    plan.total_size = file_size;
    plan.chunk_size = chunk_size;

    if (file_size <= chunk_size) {
        plan.mode = UploadMode::Simple;
        return mpu::Ok(std::move(plan));
    }

    if (chunk_size < limits_.min_part_size) {
        return mpu::Err<UploadPlan>(Error::config(
            "Chunk size must be at least " + std::to_string(limits_.min_part_size) + " bytes"));
    }

    const auto part_count = part_count_for(file_size, chunk_size);
    if (part_count > limits_.max_parts) {
        return mpu::Err<UploadPlan>(Error::config(
            "File would require " + std::to_string(part_count) + " parts, but the backend supports at most " +
            std::to_string(limits_.max_parts) + " parts"));
    }

    plan.mode = UploadMode::Multipart;
    plan.parts.reserve(static_cast<std::size_t>(part_count));
    for (std::uint64_t index = 0; index < part_count; ++index) {
        PartDescriptor part;
        part.part_number = static_cast<std::uint32_t>(index + 1);
        part.start = index * chunk_size;
        part.end = std::min(part.start + chunk_size, file_size);
        plan.parts.push_back(std::move(part));
    }

    return mpu::Ok(std::move(plan));
}

} // namespace mpu::upload
