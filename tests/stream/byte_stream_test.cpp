#include "mpu/stream/byte_stream.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

using mpu::ErrorCode;
using mpu::stream::FileRangeSource;
using mpu::stream::FileSink;
using mpu::stream::MemorySource;
using mpu::stream::VectorSink;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("mpu_stream_test_" + std::to_string(id));
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

std::vector<std::uint8_t> bytes_of(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

} // namespace

TEST(ByteStreamTest, FileRangeSourceReadsOnlyItsRange) {
    const auto dir = create_temp_dir();
    const auto file = dir / "data.bin";
    write_file(file, "0123456789");

    auto source = FileRangeSource::open(file, 3, 7);
    ASSERT_TRUE(source.is_ok());
    EXPECT_EQ(source.value()->size_hint().value_or(0), 4u);

    std::vector<std::uint8_t> out;
    VectorSink sink(out);
    auto copied = mpu::stream::pipe(*source.value(), sink, 3);
    ASSERT_TRUE(copied.is_ok());
    EXPECT_EQ(copied.value(), 4u);
    EXPECT_EQ(std::string(out.begin(), out.end()), "3456");

    fs::remove_all(dir);
}

TEST(ByteStreamTest, FileRangeSourceRejectsRangePastEnd) {
    const auto dir = create_temp_dir();
    const auto file = dir / "data.bin";
    write_file(file, "abc");

    auto source = FileRangeSource::open(file, 1, 10);
    ASSERT_TRUE(source.is_error());
    EXPECT_EQ(source.error().code, ErrorCode::Validation);

    fs::remove_all(dir);
}

TEST(ByteStreamTest, MissingFileIsIoError) {
    auto source = FileRangeSource::open(fs::temp_directory_path() / "mpu_definitely_missing_file.bin");
    ASSERT_TRUE(source.is_error());
    EXPECT_EQ(source.error().code, ErrorCode::Io);
}

TEST(ByteStreamTest, PipeReportsCumulativeProgress) {
    MemorySource source(bytes_of(std::string(10, 'x')));
    std::vector<std::uint8_t> out;
    VectorSink sink(out);

    std::vector<std::uint64_t> progress;
    auto copied = mpu::stream::pipe(source, sink, 4, [&](std::uint64_t n) { progress.push_back(n); });

    ASSERT_TRUE(copied.is_ok());
    EXPECT_EQ(progress, (std::vector<std::uint64_t>{4, 8, 10}));
    EXPECT_EQ(out.size(), 10u);
}

TEST(ByteStreamTest, PipeRejectsZeroBuffer) {
    MemorySource source(bytes_of("abc"));
    std::vector<std::uint8_t> out;
    VectorSink sink(out);

    auto copied = mpu::stream::pipe(source, sink, 0);
    ASSERT_TRUE(copied.is_error());
    EXPECT_EQ(copied.error().code, ErrorCode::Validation);
}

TEST(ByteStreamTest, ReadAllEnforcesLimit) {
    MemorySource within(bytes_of("hello"));
    auto ok = mpu::stream::read_all(within, 5);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value().size(), 5u);

    MemorySource over(bytes_of("hello!"));
    auto too_big = mpu::stream::read_all(over, 5);
    ASSERT_TRUE(too_big.is_error());
    EXPECT_EQ(too_big.error().code, ErrorCode::Validation);
}

TEST(ByteStreamTest, FileSinkCreatesParentsAndWrites) {
    const auto dir = create_temp_dir();
    const auto target = dir / "nested" / "out.bin";

    auto sink = FileSink::create(target);
    ASSERT_TRUE(sink.is_ok());

    const auto payload = bytes_of("payload");
    ASSERT_TRUE(sink.value()->write(payload.data(), payload.size()).is_ok());
    ASSERT_TRUE(sink.value()->close().is_ok());
    // Closing twice is harmless
    EXPECT_TRUE(sink.value()->close().is_ok());

    EXPECT_EQ(read_file(target), "payload");
    fs::remove_all(dir);
}

TEST(ByteStreamTest, LargeFileStreamsThroughSmallBuffer) {
    const auto dir = create_temp_dir();
    const auto file = dir / "large.bin";
    std::string content;
    for (int i = 0; i < 300000; ++i) {
        content += static_cast<char>('a' + i % 26);
    }
    write_file(file, content);

    auto source = FileRangeSource::open(file);
    ASSERT_TRUE(source.is_ok());
    auto sink = FileSink::create(dir / "copy.bin");
    ASSERT_TRUE(sink.is_ok());

    auto copied = mpu::stream::pipe(*source.value(), *sink.value(), 1024);
    ASSERT_TRUE(copied.is_ok());
    ASSERT_TRUE(sink.value()->close().is_ok());
    EXPECT_EQ(copied.value(), content.size());
    EXPECT_EQ(read_file(dir / "copy.bin"), content);

    fs::remove_all(dir);
}
