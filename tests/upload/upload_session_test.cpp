#include "mpu/upload/upload_session.hpp"

#include <gtest/gtest.h>

using mpu::ErrorCode;
using mpu::upload::UploadMode;
using mpu::upload::UploadSession;
using mpu::upload::UploadState;

TEST(UploadSessionTest, StartsInPlanning) {
    UploadSession session("a.bin", 100, 10);

    EXPECT_EQ(session.state(), UploadState::Planning);
    EXPECT_EQ(session.key(), "a.bin");
    EXPECT_EQ(session.info().total_size, 100u);
    EXPECT_FALSE(session.is_terminal());
}

TEST(UploadSessionTest, MultipartHappyPath) {
    UploadSession session("a.bin", 100, 10);
    session.bind(UploadMode::Multipart, "upload-1", 10);

    EXPECT_TRUE(session.transition_to(UploadState::AwaitingParts).is_ok());
    EXPECT_TRUE(session.transition_to(UploadState::Completing).is_ok());
    EXPECT_TRUE(session.transition_to(UploadState::Done).is_ok());
    EXPECT_TRUE(session.is_terminal());
    EXPECT_EQ(session.upload_id(), "upload-1");
    EXPECT_EQ(session.info().part_count, 10u);
}

TEST(UploadSessionTest, FailedCompletionReturnsToAwaitingParts) {
    UploadSession session("a.bin", 100, 10);
    ASSERT_TRUE(session.transition_to(UploadState::AwaitingParts).is_ok());
    ASSERT_TRUE(session.transition_to(UploadState::Completing).is_ok());

    EXPECT_TRUE(session.transition_to(UploadState::AwaitingParts).is_ok());
    EXPECT_EQ(session.state(), UploadState::AwaitingParts);
}

TEST(UploadSessionTest, SimpleUploadGoesStraightToDone) {
    UploadSession session("a.bin", 5, 10);
    session.bind(UploadMode::Simple, "", 0);

    EXPECT_TRUE(session.transition_to(UploadState::Done).is_ok());
}

TEST(UploadSessionTest, RejectsSkippingAwaitingParts) {
    UploadSession session("a.bin", 100, 10);

    auto moved = session.transition_to(UploadState::Completing);
    ASSERT_TRUE(moved.is_error());
    EXPECT_EQ(moved.error().code, ErrorCode::InvalidState);
    EXPECT_EQ(session.state(), UploadState::Planning);
}

TEST(UploadSessionTest, TerminalStatesAreFinal) {
    UploadSession session("a.bin", 100, 10);
    ASSERT_TRUE(session.transition_to(UploadState::Aborted).is_ok());

    EXPECT_TRUE(session.transition_to(UploadState::AwaitingParts).is_error());
    EXPECT_TRUE(session.transition_to(UploadState::Done).is_error());
    EXPECT_EQ(session.state(), UploadState::Aborted);
}

TEST(UploadSessionTest, SameStateTransitionIsNoOp) {
    UploadSession session("a.bin", 100, 10);
    ASSERT_TRUE(session.transition_to(UploadState::Aborted).is_ok());

    EXPECT_TRUE(session.transition_to(UploadState::Aborted).is_ok());
}

TEST(UploadSessionTest, AbortAllowedWhileCompleting) {
    UploadSession session("a.bin", 100, 10);
    ASSERT_TRUE(session.transition_to(UploadState::AwaitingParts).is_ok());
    ASSERT_TRUE(session.transition_to(UploadState::Completing).is_ok());

    EXPECT_TRUE(session.transition_to(UploadState::Aborted).is_ok());
}
