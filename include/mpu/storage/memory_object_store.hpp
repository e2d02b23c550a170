#pragma once

#include "mpu/storage/object_store.hpp"

#include <atomic>
#include <mutex>
#include <unordered_map>

namespace mpu::storage {

/**
 * @brief Thread-safe in-memory backend
 *
 * Object bodies are held as shared immutable buffers so readers opened with
 * open_object() keep streaming even if the key is overwritten meanwhile.
 */
class MemoryObjectStore : public ObjectStoreAdapter {
public:
    explicit MemoryObjectStore(StoreConfig config = {});

    mpu::Result<std::string> put_object(const std::string& key,
                                        const std::vector<std::uint8_t>& bytes,
                                        const ObjectMetadata& metadata = {}) override;

    mpu::Result<std::string> create_multipart(const std::string& key,
                                              const ObjectMetadata& metadata) override;

    mpu::Result<std::string> upload_part(const std::string& key,
                                         const std::string& upload_id,
                                         std::uint32_t part_number,
                                         const std::vector<std::uint8_t>& bytes) override;

    mpu::Result<void> abort_multipart(const std::string& key, const std::string& upload_id) override;

    mpu::Result<ObjectData> get_object(const std::string& key) override;
    mpu::Result<ObjectReader> open_object(const std::string& key) override;
    mpu::Result<ObjectInfo> head_object(const std::string& key) override;
    mpu::Result<std::vector<ObjectInfo>> list_objects() override;

    /// Uploads created but neither completed nor aborted
    [[nodiscard]] std::size_t pending_upload_count() const;

    /// Parts currently held for an upload (0 if unknown)
    [[nodiscard]] std::size_t pending_part_count(const std::string& upload_id) const;

protected:
    mpu::Result<ObjectInfo> do_complete_multipart(const std::string& key,
                                                  const std::string& upload_id,
                                                  const std::vector<CompletedPart>& sorted_parts) override;

private:
    struct StoredObject {
        std::shared_ptr<const std::vector<std::uint8_t>> data;
        ObjectInfo info;
    };

    struct StoredPart {
        std::shared_ptr<const std::vector<std::uint8_t>> data;
        PartRecord record;
    };

    struct PendingUpload {
        std::string key;
        ObjectMetadata metadata;
        std::map<std::uint32_t, StoredPart> parts;
    };

    std::string next_upload_id();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, StoredObject> objects_;
    std::unordered_map<std::string, PendingUpload> uploads_;
    std::atomic<std::uint64_t> upload_counter_{0};
};

} // namespace mpu::storage
