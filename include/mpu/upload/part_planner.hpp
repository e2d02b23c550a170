#pragma once

#include "mpu/core/result.hpp"
#include "mpu/upload/types.hpp"

#include <cstdint>

namespace mpu::upload {

/**
 * @brief Backend constraints the planner enforces
 */
struct PlannerLimits {
    std::uint64_t min_part_size = kMinPartSize;
    std::uint32_t max_parts = kMaxParts;
};

/**
 * @brief Decides between a single put and a multipart upload
 *
 * Pure and deterministic: the same inputs always produce the same plan.
 * Violations of the backend limits are reported as ErrorCode::Config so that
 * nothing reaches the object store.
 *
 * Example:
 * @code
 * PartPlanner planner;
 * auto plan = planner.plan(25 * kMiB, 10 * kMiB);
 * // plan.value().parts -> [1:[0,10MiB), 2:[10MiB,20MiB), 3:[20MiB,25MiB)]
 * @endcode
 */
class PartPlanner {
public:
    PartPlanner() = default;
    explicit PartPlanner(PlannerLimits limits) : limits_(limits) {}

    [[nodiscard]] mpu::Result<UploadPlan> plan(std::uint64_t file_size,
                                               std::uint64_t chunk_size) const;

    [[nodiscard]] const PlannerLimits& limits() const noexcept { return limits_; }

    /// ceil(file_size / chunk_size) without overflow
    static std::uint64_t part_count_for(std::uint64_t file_size, std::uint64_t chunk_size) noexcept;

private:
    PlannerLimits limits_;
};

} // namespace mpu::upload
