#include "mpu/upload/part_planner.hpp"

#include <gtest/gtest.h>

using mpu::ErrorCode;
using mpu::upload::kMiB;
using mpu::upload::PartPlanner;
using mpu::upload::PlannerLimits;
using mpu::upload::UploadMode;

TEST(PartPlannerTest, SmallFileUsesSimpleMode) {
    PartPlanner planner;
    auto plan = planner.plan(1 * kMiB, 10 * kMiB);

    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.value().mode, UploadMode::Simple);
    EXPECT_TRUE(plan.value().parts.empty());
    EXPECT_EQ(plan.value().total_size, 1 * kMiB);
}

TEST(PartPlannerTest, FileEqualToChunkIsSimple) {
    PartPlanner planner;
    auto plan = planner.plan(10 * kMiB, 10 * kMiB);

    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.value().mode, UploadMode::Simple);
}

TEST(PartPlannerTest, EmptyFileIsSimple) {
    PartPlanner planner;
    auto plan = planner.plan(0, 10 * kMiB);

    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.value().mode, UploadMode::Simple);
}

TEST(PartPlannerTest, SplitsLargeFileIntoContiguousParts) {
    PartPlanner planner;
    auto plan = planner.plan(25 * kMiB, 10 * kMiB);

    ASSERT_TRUE(plan.is_ok());
    const auto& parts = plan.value().parts;
    EXPECT_EQ(plan.value().mode, UploadMode::Multipart);
    ASSERT_EQ(parts.size(), 3u);

    EXPECT_EQ(parts[0].part_number, 1u);
    EXPECT_EQ(parts[0].start, 0u);
    EXPECT_EQ(parts[0].end, 10 * kMiB);

    EXPECT_EQ(parts[1].part_number, 2u);
    EXPECT_EQ(parts[1].start, 10 * kMiB);
    EXPECT_EQ(parts[1].end, 20 * kMiB);

    EXPECT_EQ(parts[2].part_number, 3u);
    EXPECT_EQ(parts[2].start, 20 * kMiB);
    EXPECT_EQ(parts[2].end, 25 * kMiB);
    EXPECT_EQ(parts[2].size(), 5 * kMiB);
}

TEST(PartPlannerTest, PartsCoverEveryByteExactlyOnce) {
    PartPlanner planner;
    const std::uint64_t size = 123 * kMiB + 17;
    auto plan = planner.plan(size, 7 * kMiB);

    ASSERT_TRUE(plan.is_ok());
    std::uint64_t expected_start = 0;
    std::uint64_t total = 0;
    for (std::size_t i = 0; i < plan.value().parts.size(); ++i) {
        const auto& part = plan.value().parts[i];
        EXPECT_EQ(part.part_number, i + 1);
        EXPECT_EQ(part.start, expected_start);
        EXPECT_GT(part.size(), 0u);
        expected_start = part.end;
        total += part.size();
    }
    EXPECT_EQ(total, size);
    EXPECT_EQ(plan.value().part_count(), PartPlanner::part_count_for(size, 7 * kMiB));
}

TEST(PartPlannerTest, TooManyPartsIsConfigError) {
    PartPlanner planner;
    auto plan = planner.plan(100ULL * 1024 * kMiB, 10 * kMiB);

    ASSERT_TRUE(plan.is_error());
    EXPECT_EQ(plan.error().code, ErrorCode::Config);
    EXPECT_NE(plan.error().message.find("10240"), std::string::npos);
}

TEST(PartPlannerTest, ExactlyMaxPartsIsAccepted) {
    PlannerLimits limits;
    limits.min_part_size = 1;
    limits.max_parts = 4;
    PartPlanner planner(limits);

    auto plan = planner.plan(40, 10);
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.value().part_count(), 4u);

    auto over = planner.plan(41, 10);
    ASSERT_TRUE(over.is_error());
    EXPECT_EQ(over.error().code, ErrorCode::Config);
}

TEST(PartPlannerTest, ZeroChunkSizeIsConfigError) {
    PartPlanner planner;
    auto plan = planner.plan(1 * kMiB, 0);

    ASSERT_TRUE(plan.is_error());
    EXPECT_EQ(plan.error().code, ErrorCode::Config);
}

TEST(PartPlannerTest, ChunkBelowMinimumPartSizeIsConfigError) {
    PartPlanner planner;
    auto plan = planner.plan(20 * kMiB, 1 * kMiB);

    ASSERT_TRUE(plan.is_error());
    EXPECT_EQ(plan.error().code, ErrorCode::Config);
}

TEST(PartPlannerTest, SmallChunkIsFineWhenNoSplitIsNeeded) {
    PartPlanner planner;
    auto plan = planner.plan(512, 1024);

    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.value().mode, UploadMode::Simple);
}

TEST(PartPlannerTest, PlanningIsDeterministic) {
    PartPlanner planner;
    auto first = planner.plan(55 * kMiB, 10 * kMiB);
    auto second = planner.plan(55 * kMiB, 10 * kMiB);

    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    ASSERT_EQ(first.value().parts.size(), second.value().parts.size());
    for (std::size_t i = 0; i < first.value().parts.size(); ++i) {
        EXPECT_EQ(first.value().parts[i].start, second.value().parts[i].start);
        EXPECT_EQ(first.value().parts[i].end, second.value().parts[i].end);
    }
}

TEST(PartPlannerTest, PartCountRoundsUp) {
    EXPECT_EQ(PartPlanner::part_count_for(0, 10), 0u);
    EXPECT_EQ(PartPlanner::part_count_for(10, 10), 1u);
    EXPECT_EQ(PartPlanner::part_count_for(11, 10), 2u);
    EXPECT_EQ(PartPlanner::part_count_for(5, 0), 0u);
}
