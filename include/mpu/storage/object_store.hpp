#pragma once

#include "mpu/core/result.hpp"
#include "mpu/stream/byte_stream.hpp"
#include "mpu/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mpu::storage {

using upload::CompletedPart;

inline constexpr std::size_t kMaxKeyLength = 1024;
inline constexpr const char* kDefaultContentType = "application/octet-stream";

/**
 * @brief HTTP-style metadata attached to an object at creation time
 */
struct ObjectMetadata {
    std::string content_type = kDefaultContentType;
    std::string cache_control;
    std::map<std::string, std::string> custom;
};

struct ObjectInfo {
    std::string key;
    std::uint64_t size = 0;
    std::chrono::system_clock::time_point uploaded_at{};
    std::string etag;
    std::string content_type = kDefaultContentType;
};

/**
 * @brief Whole object materialised in memory
 */
struct ObjectData {
    std::vector<std::uint8_t> bytes;
    std::uint64_t size = 0;
    std::string content_type = kDefaultContentType;
    std::string etag;
};

/**
 * @brief Streaming handle to an object; memory use is bounded by the reader's buffer
 */
struct ObjectReader {
    ObjectInfo info;
    std::unique_ptr<stream::ByteSource> body;
};

/**
 * @brief Construction-time settings injected into every backend
 */
struct StoreConfig {
    std::filesystem::path root;                      ///< Disk backend only
    std::uint64_t min_part_size = upload::kMinPartSize;
    std::uint32_t max_parts = upload::kMaxParts;
};

/**
 * @brief Bookkeeping for one uploaded-but-uncommitted part
 */
struct PartRecord {
    std::string etag;
    std::uint64_t size = 0;
};

/**
 * @brief Uniform interface over an object store's put/multipart/get/list primitives
 *
 * Backends implement the protected do_complete_multipart(); the public
 * complete_multipart() always hands them a list sorted by part number because
 * the store rejects out-of-order completion requests.
 *
 * Semantics every backend honours:
 * - put_object overwrites whatever exists at the key
 * - upload_part is idempotent per (upload_id, part_number): the last write wins
 * - abort_multipart is idempotent; aborting an unknown, completed or already
 *   aborted upload succeeds without effect
 *
 * Thread safety: all methods may be called concurrently, including for the
 * same upload id.
 */
class ObjectStoreAdapter {
public:
    explicit ObjectStoreAdapter(StoreConfig config) : config_(std::move(config)) {}
    virtual ~ObjectStoreAdapter() = default;

    ObjectStoreAdapter(const ObjectStoreAdapter&) = delete;
    ObjectStoreAdapter& operator=(const ObjectStoreAdapter&) = delete;

    /// @return ETag of the stored object
    virtual mpu::Result<std::string> put_object(const std::string& key,
                                                const std::vector<std::uint8_t>& bytes,
                                                const ObjectMetadata& metadata = {}) = 0;

    /// @return Store-assigned upload id
    virtual mpu::Result<std::string> create_multipart(const std::string& key,
                                                      const ObjectMetadata& metadata) = 0;

    /// @return ETag of the part
    virtual mpu::Result<std::string> upload_part(const std::string& key,
                                                 const std::string& upload_id,
                                                 std::uint32_t part_number,
                                                 const std::vector<std::uint8_t>& bytes) = 0;

    mpu::Result<ObjectInfo> complete_multipart(const std::string& key,
                                               const std::string& upload_id,
                                               std::vector<CompletedPart> parts);

    virtual mpu::Result<void> abort_multipart(const std::string& key, const std::string& upload_id) = 0;

    virtual mpu::Result<ObjectData> get_object(const std::string& key) = 0;
    virtual mpu::Result<ObjectReader> open_object(const std::string& key) = 0;
    virtual mpu::Result<ObjectInfo> head_object(const std::string& key) = 0;

    /// Sorted by key
    virtual mpu::Result<std::vector<ObjectInfo>> list_objects() = 0;

    [[nodiscard]] const StoreConfig& config() const noexcept { return config_; }

    /// Rejects empty, oversized and NUL-containing keys
    static mpu::Result<void> validate_key(const std::string& key);

    static std::string strip_etag_quotes(const std::string& etag);

    /// ETag of a multipart object: digest of the part ETags plus "-<part count>"
    static std::string multipart_etag(const std::vector<CompletedPart>& sorted_parts);

protected:
    virtual mpu::Result<ObjectInfo> do_complete_multipart(const std::string& key,
                                                          const std::string& upload_id,
                                                          const std::vector<CompletedPart>& sorted_parts) = 0;

    /**
     * @brief Check a sorted completion request against what was uploaded
     *
     * Fails with ErrorCode::Backend when the list is empty, contains duplicate
     * or missing part numbers, references a part never uploaded, carries a
     * mismatched ETag, or a non-final part is smaller than min_part_size.
     */
    mpu::Result<void> validate_completion(const std::vector<CompletedPart>& sorted_parts,
                                          const std::map<std::uint32_t, PartRecord>& uploaded) const;

    mpu::Result<void> validate_part_number(std::uint32_t part_number) const;

private:
    StoreConfig config_;
};

} // namespace mpu::storage
