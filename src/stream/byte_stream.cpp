#include "mpu/stream/byte_stream.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <system_error>

namespace mpu::stream {
namespace fs = std::filesystem;

MemorySource::MemorySource(std::vector<std::uint8_t> data)
    : data_(std::make_shared<const std::vector<std::uint8_t>>(std::move(data))) {}

MemorySource::MemorySource(std::shared_ptr<const std::vector<std::uint8_t>> data)
    : data_(std::move(data)) {
    if (!data_) {
        data_ = std::make_shared<const std::vector<std::uint8_t>>();
    }
}

mpu::Result<std::size_t> MemorySource::read(std::uint8_t* buffer, std::size_t capacity) {
    const std::size_t remaining = data_->size() - offset_;
    const std::size_t count = std::min(remaining, capacity);
    if (count > 0) {
        std::memcpy(buffer, data_->data() + offset_, count);
        offset_ += count;
    }
    return mpu::Ok(count);
}

FileRangeSource::FileRangeSource(fs::path path, std::ifstream input, std::uint64_t start, std::uint64_t end)
    : path_(std::move(path)),
      input_(std::move(input)),
      start_(start),
      end_(end),
      position_(start) {}

mpu::Result<std::unique_ptr<FileRangeSource>> FileRangeSource::open(const fs::path& path,
                                                                    std::uint64_t start,
                                                                    std::uint64_t end) {
    std::error_code ec;
    const auto file_size = fs::file_size(path, ec);
    if (ec) {
        return mpu::Err<std::unique_ptr<FileRangeSource>>(
            Error::io("Failed to stat file: " + path.string() + " - " + ec.message()));
    }
    if (start > end || end > file_size) {
        return mpu::Err<std::unique_ptr<FileRangeSource>>(
            Error::validation("Byte range [" + std::to_string(start) + ", " + std::to_string(end) +
                              ") is outside " + path.string()));
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return mpu::Err<std::unique_ptr<FileRangeSource>>(Error::io("Failed to open file: " + path.string()));
    }
    input.seekg(static_cast<std::streamoff>(start));
    if (!input) {
        return mpu::Err<std::unique_ptr<FileRangeSource>>(Error::io("Failed to seek in file: " + path.string()));
    }

    return mpu::Ok(std::unique_ptr<FileRangeSource>(new FileRangeSource(path, std::move(input), start, end)));
}

mpu::Result<std::unique_ptr<FileRangeSource>> FileRangeSource::open(const fs::path& path) {
    std::error_code ec;
    const auto file_size = fs::file_size(path, ec);
    if (ec) {
        return mpu::Err<std::unique_ptr<FileRangeSource>>(
            Error::io("Failed to stat file: " + path.string() + " - " + ec.message()));
    }
    return open(path, 0, file_size);
}

mpu::Result<std::size_t> FileRangeSource::read(std::uint8_t* buffer, std::size_t capacity) {
    const std::uint64_t remaining = end_ - position_;
    const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, capacity));
    if (wanted == 0) {
        return mpu::Ok(std::size_t{0});
    }

    input_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(wanted));
    const auto count = static_cast<std::size_t>(input_.gcount());
    if (count != wanted) {
        return mpu::Err<std::size_t>(Error::io("Short read from " + path_.string() + " at offset " +
                                               std::to_string(position_ + count)));
    }
    position_ += count;
    return mpu::Ok(count);
}

mpu::Result<void> VectorSink::write(const std::uint8_t* data, std::size_t length) {
    target_.insert(target_.end(), data, data + length);
    return mpu::Ok();
}

FileSink::FileSink(fs::path path, std::ofstream output)
    : path_(std::move(path)), output_(std::move(output)) {}

mpu::Result<std::unique_ptr<FileSink>> FileSink::create(const fs::path& path) {
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec && !fs::exists(parent)) {
            return mpu::Err<std::unique_ptr<FileSink>>(Error::io("Failed to create directory: " + parent.string()));
        }
    }

    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return mpu::Err<std::unique_ptr<FileSink>>(Error::io("Failed to create file: " + path.string()));
    }
    return mpu::Ok(std::unique_ptr<FileSink>(new FileSink(path, std::move(output))));
}

mpu::Result<void> FileSink::write(const std::uint8_t* data, std::size_t length) {
    output_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
    if (!output_) {
        return mpu::Err<void>(Error::io("Failed to write to " + path_.string()));
    }
    return mpu::Ok();
}

mpu::Result<void> FileSink::close() {
    if (!output_.is_open()) {
        return mpu::Ok();
    }
    output_.flush();
    const bool ok = static_cast<bool>(output_);
    output_.close();
    if (!ok) {
        return mpu::Err<void>(Error::io("Failed to flush " + path_.string()));
    }
    return mpu::Ok();
}

mpu::Result<std::uint64_t> pipe(ByteSource& source,
                                ByteSink& sink,
                                std::size_t buffer_size,
                                const ProgressCallback& on_progress) {
    if (buffer_size == 0) {
        return mpu::Err<std::uint64_t>(Error::validation("buffer_size must be > 0"));
    }

    std::vector<std::uint8_t> buffer(buffer_size);
    std::uint64_t copied = 0;

    while (true) {
        auto read_result = source.read(buffer.data(), buffer.size());
        if (read_result.is_error()) {
            return mpu::Err<std::uint64_t>(read_result.error());
        }
        const std::size_t count = read_result.value();
        if (count == 0) {
            break;
        }

        auto write_result = sink.write(buffer.data(), count);
        if (write_result.is_error()) {
            return mpu::Err<std::uint64_t>(write_result.error());
        }

        copied += count;
        if (on_progress) {
            on_progress(copied);
        }
    }

    return mpu::Ok(copied);
}

mpu::Result<std::vector<std::uint8_t>> read_all(ByteSource& source, std::uint64_t limit) {
    std::vector<std::uint8_t> data;
    if (auto hint = source.size_hint(); hint && *hint <= limit) {
        data.reserve(static_cast<std::size_t>(*hint));
    }

    std::vector<std::uint8_t> buffer(kDefaultBufferSize);
    while (true) {
        auto read_result = source.read(buffer.data(), buffer.size());
        if (read_result.is_error()) {
            return mpu::Err<std::vector<std::uint8_t>>(read_result.error());
        }
        const std::size_t count = read_result.value();
        if (count == 0) {
            break;
        }
        if (data.size() + count > limit) {
            return mpu::Err<std::vector<std::uint8_t>>(
                Error::validation("Stream exceeds limit of " + std::to_string(limit) + " bytes"));
        }
        data.insert(data.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(count));
    }
    return mpu::Ok(std::move(data));
}

} // namespace mpu::stream
