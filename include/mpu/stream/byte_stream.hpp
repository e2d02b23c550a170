#pragma once

#include "mpu/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace mpu::stream {

inline constexpr std::size_t kDefaultBufferSize = 64 * 1024;

/**
 * @brief Pull-based byte producer
 *
 * read() fills at most `capacity` bytes and returns how many were produced.
 * A return of 0 signals end of stream.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual mpu::Result<std::size_t> read(std::uint8_t* buffer, std::size_t capacity) = 0;

    /// Total bytes this source will produce, when known up front
    virtual std::optional<std::uint64_t> size_hint() const { return std::nullopt; }
};

/**
 * @brief Push-based byte consumer
 */
class ByteSink {
public:
    virtual ~ByteSink() = default;

    virtual mpu::Result<void> write(const std::uint8_t* data, std::size_t length) = 0;
    virtual mpu::Result<void> close() { return mpu::Ok(); }
};

/**
 * @brief Source over an in-memory buffer
 *
 * The buffer is shared so that a stored object can be streamed without a copy.
 */
class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::vector<std::uint8_t> data);
    explicit MemorySource(std::shared_ptr<const std::vector<std::uint8_t>> data);

    mpu::Result<std::size_t> read(std::uint8_t* buffer, std::size_t capacity) override;
    std::optional<std::uint64_t> size_hint() const override { return data_->size(); }

private:
    std::shared_ptr<const std::vector<std::uint8_t>> data_;
    std::size_t offset_ = 0;
};

/**
 * @brief Source over the byte range [start, end) of a file
 */
class FileRangeSource : public ByteSource {
public:
    static mpu::Result<std::unique_ptr<FileRangeSource>> open(const std::filesystem::path& path,
                                                              std::uint64_t start,
                                                              std::uint64_t end);

    /// Whole-file convenience
    static mpu::Result<std::unique_ptr<FileRangeSource>> open(const std::filesystem::path& path);

    mpu::Result<std::size_t> read(std::uint8_t* buffer, std::size_t capacity) override;
    std::optional<std::uint64_t> size_hint() const override { return end_ - start_; }

private:
    FileRangeSource(std::filesystem::path path, std::ifstream input, std::uint64_t start, std::uint64_t end);

    std::filesystem::path path_;
    std::ifstream input_;
    std::uint64_t start_;
    std::uint64_t end_;
    std::uint64_t position_;
};

/**
 * @brief Sink appending into a caller-owned vector
 */
class VectorSink : public ByteSink {
public:
    explicit VectorSink(std::vector<std::uint8_t>& target) : target_(target) {}

    mpu::Result<void> write(const std::uint8_t* data, std::size_t length) override;

private:
    std::vector<std::uint8_t>& target_;
};

/**
 * @brief Sink writing (truncating) a file
 */
class FileSink : public ByteSink {
public:
    static mpu::Result<std::unique_ptr<FileSink>> create(const std::filesystem::path& path);

    mpu::Result<void> write(const std::uint8_t* data, std::size_t length) override;
    mpu::Result<void> close() override;

private:
    FileSink(std::filesystem::path path, std::ofstream output);

    std::filesystem::path path_;
    std::ofstream output_;
};

using ProgressCallback = std::function<void(std::uint64_t bytes_copied)>;

/**
 * @brief Copy source into sink through one fixed-size buffer
 *
 * Memory use is bounded by `buffer_size` regardless of the stream length.
 * The sink is not closed; callers decide when the destination is final.
 *
 * @return Number of bytes copied
 */
mpu::Result<std::uint64_t> pipe(ByteSource& source,
                                ByteSink& sink,
                                std::size_t buffer_size = kDefaultBufferSize,
                                const ProgressCallback& on_progress = {});

/**
 * @brief Drain a source into memory, failing once more than `limit` bytes arrive
 */
mpu::Result<std::vector<std::uint8_t>> read_all(ByteSource& source, std::uint64_t limit);

} // namespace mpu::stream
