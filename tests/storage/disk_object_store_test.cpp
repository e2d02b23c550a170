#include "mpu/storage/disk_object_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

namespace fs = std::filesystem;

using mpu::ErrorCode;
using mpu::storage::CompletedPart;
using mpu::storage::DiskObjectStore;
using mpu::storage::ObjectMetadata;
using mpu::storage::StoreConfig;

namespace {

fs::path create_temp_dir() {
    static std::atomic<int> counter{0};
    auto dir = fs::temp_directory_path() / ("mpu_disk_store_test_" + std::to_string(::getpid()) + "_" +
                                            std::to_string(counter++));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::vector<std::uint8_t> bytes_of(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

std::string text_of(const std::vector<std::uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

class DiskObjectStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
        StoreConfig config;
        config.root = root_;
        config.min_part_size = 4;
        config.max_parts = 10;
        store_ = std::make_unique<DiskObjectStore>(config);
        ASSERT_TRUE(store_->initialize().is_ok());
    }

    void TearDown() override {
        store_.reset();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path root_;
    std::unique_ptr<DiskObjectStore> store_;
};

} // namespace

TEST_F(DiskObjectStoreTest, PutThenGet) {
    ObjectMetadata metadata;
    metadata.content_type = "image/png";

    auto etag = store_->put_object("photos/cat.png", bytes_of("meow"), metadata);
    ASSERT_TRUE(etag.is_ok()) << etag.error().message;

    auto object = store_->get_object("photos/cat.png");
    ASSERT_TRUE(object.is_ok());
    EXPECT_EQ(text_of(object.value().bytes), "meow");
    EXPECT_EQ(object.value().content_type, "image/png");
    EXPECT_EQ(object.value().etag, etag.value());
}

TEST_F(DiskObjectStoreTest, KeysCannotEscapeRoot) {
    ASSERT_TRUE(store_->put_object("../escape", bytes_of("x")).is_ok());

    EXPECT_FALSE(fs::exists(root_ / "objects" / "escape"));
    EXPECT_FALSE(fs::exists(root_.parent_path() / "escape"));
    EXPECT_TRUE(store_->put_object("..", bytes_of("x")).is_error());
}

TEST_F(DiskObjectStoreTest, MultipartCommitsAndCleansStaging) {
    auto id = store_->create_multipart("video.mp4", {});
    ASSERT_TRUE(id.is_ok());

    auto etag2 = store_->upload_part("video.mp4", id.value(), 2, bytes_of("EFGH"));
    auto etag1 = store_->upload_part("video.mp4", id.value(), 1, bytes_of("ABCD"));
    auto etag3 = store_->upload_part("video.mp4", id.value(), 3, bytes_of("I"));
    ASSERT_TRUE(etag1.is_ok() && etag2.is_ok() && etag3.is_ok());

    auto info = store_->complete_multipart("video.mp4", id.value(), {
        CompletedPart{2, etag2.value()},
        CompletedPart{3, etag3.value()},
        CompletedPart{1, etag1.value()},
    });
    ASSERT_TRUE(info.is_ok()) << info.error().message;
    EXPECT_EQ(info.value().size, 9u);

    EXPECT_FALSE(fs::exists(root_ / "staging" / id.value()));
    EXPECT_EQ(text_of(store_->get_object("video.mp4").value().bytes), "ABCDEFGHI");

    auto head = store_->head_object("video.mp4");
    ASSERT_TRUE(head.is_ok());
    EXPECT_EQ(head.value().etag, info.value().etag);
}

TEST_F(DiskObjectStoreTest, FailedCompletionKeepsStagedParts) {
    auto id = store_->create_multipart("k", {}).value();
    ASSERT_TRUE(store_->upload_part("k", id, 1, bytes_of("abcd")).is_ok());

    auto info = store_->complete_multipart("k", id, {CompletedPart{1, "wrong"}});
    ASSERT_TRUE(info.is_error());
    EXPECT_EQ(info.error().code, ErrorCode::Backend);
    EXPECT_TRUE(fs::exists(root_ / "staging" / id / "1.part"));
    EXPECT_EQ(store_->head_object("k").error().code, ErrorCode::NotFound);
}

TEST_F(DiskObjectStoreTest, CompletionKeepsContentTypeFromCreate) {
    ObjectMetadata metadata;
    metadata.content_type = "application/zip";
    auto id = store_->create_multipart("a.zip", metadata).value();
    auto etag = store_->upload_part("a.zip", id, 1, bytes_of("zip")).value();

    ASSERT_TRUE(store_->complete_multipart("a.zip", id, {CompletedPart{1, etag}}).is_ok());
    EXPECT_EQ(store_->head_object("a.zip").value().content_type, "application/zip");
}

TEST_F(DiskObjectStoreTest, AbortRemovesStagingAndIsIdempotent) {
    auto id = store_->create_multipart("k", {}).value();
    ASSERT_TRUE(store_->upload_part("k", id, 1, bytes_of("abcd")).is_ok());

    EXPECT_TRUE(store_->abort_multipart("k", id).is_ok());
    EXPECT_FALSE(fs::exists(root_ / "staging" / id));
    EXPECT_TRUE(store_->abort_multipart("k", id).is_ok());

    auto late = store_->upload_part("k", id, 2, bytes_of("x"));
    ASSERT_TRUE(late.is_error());
    EXPECT_NE(late.error().message.find("NoSuchUpload"), std::string::npos);
}

TEST_F(DiskObjectStoreTest, UploadIdMustBelongToKey) {
    auto id = store_->create_multipart("k", {}).value();

    EXPECT_TRUE(store_->upload_part("other", id, 1, bytes_of("x")).is_error());
    EXPECT_TRUE(store_->upload_part("k", "../k", 1, bytes_of("x")).is_error());
}

TEST_F(DiskObjectStoreTest, ListReturnsSortedObjects) {
    ASSERT_TRUE(store_->put_object("zeta", bytes_of("z")).is_ok());
    ASSERT_TRUE(store_->put_object("alpha", bytes_of("aa")).is_ok());

    auto items = store_->list_objects();
    ASSERT_TRUE(items.is_ok());
    ASSERT_EQ(items.value().size(), 2u);
    EXPECT_EQ(items.value()[0].key, "alpha");
    EXPECT_EQ(items.value()[0].size, 2u);
    EXPECT_EQ(items.value()[1].key, "zeta");
}

TEST_F(DiskObjectStoreTest, ObjectsSurviveRestart) {
    ASSERT_TRUE(store_->put_object("persisted", bytes_of("data")).is_ok());

    StoreConfig config;
    config.root = root_;
    DiskObjectStore reopened(config);
    ASSERT_TRUE(reopened.initialize().is_ok());

    auto object = reopened.get_object("persisted");
    ASSERT_TRUE(object.is_ok());
    EXPECT_EQ(text_of(object.value().bytes), "data");
}

TEST_F(DiskObjectStoreTest, OpenObjectStreamsFromDisk) {
    std::string body(200 * 1024, 'q');
    ASSERT_TRUE(store_->put_object("large", bytes_of(body)).is_ok());

    auto reader = store_->open_object("large");
    ASSERT_TRUE(reader.is_ok());
    EXPECT_EQ(reader.value().info.size, body.size());

    auto bytes = mpu::stream::read_all(*reader.value().body, body.size());
    ASSERT_TRUE(bytes.is_ok());
    EXPECT_EQ(bytes.value().size(), body.size());
}

TEST(DiskObjectStoreInitTest, RequiresDataRoot) {
    DiskObjectStore store(StoreConfig{});

    auto init = store.initialize();
    ASSERT_TRUE(init.is_error());
    EXPECT_EQ(init.error().code, ErrorCode::Config);
}
