#pragma once

#include "mpu/storage/object_store.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>

namespace mpu::storage {

/**
 * @brief Local-disk backend
 *
 * Layout under StoreConfig::root:
 *   objects/data/<encoded key>        object bytes
 *   objects/meta/<encoded key>.json   content type, etag, upload time
 *   staging/<upload id>/upload.json   key and metadata of a pending upload
 *   staging/<upload id>/<n>.part      uploaded part bytes
 *
 * Keys are percent-encoded into a single path component so no key can escape
 * the root. Completion concatenates the parts into a temporary file and
 * renames it over the destination, so readers see either the old or the new
 * object, never a partial one.
 */
class DiskObjectStore : public ObjectStoreAdapter {
public:
    explicit DiskObjectStore(StoreConfig config);

    /// Creates the directory layout; must succeed before any other call
    mpu::Result<void> initialize();

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

protected:
    mpu::Result<ObjectInfo> do_complete_multipart(const std::string& key,
                                                  const std::string& upload_id,
                                                  const std::vector<CompletedPart>& sorted_parts) override;

private:
    std::filesystem::path data_path(const std::string& key) const;
    std::filesystem::path meta_path(const std::string& key) const;
    std::filesystem::path staging_path(const std::string& upload_id) const;

    mpu::Result<std::string> encode_key(const std::string& key) const;
    mpu::Result<void> check_upload(const std::string& key, const std::string& upload_id) const;
    mpu::Result<void> write_meta(const ObjectInfo& info) const;
    mpu::Result<ObjectInfo> read_meta(const std::string& key) const;
    mpu::Result<void> write_atomically(const std::filesystem::path& destination,
                                       const std::vector<std::uint8_t>& bytes) const;

    std::string next_upload_id();

    std::filesystem::path objects_data_root_;
    std::filesystem::path objects_meta_root_;
    std::filesystem::path staging_root_;

    // Serialises commits (put, complete, abort) against each other; part
    // writes go to distinct files and only take the lock for validation.
    mutable std::mutex commit_mutex_;
    std::atomic<std::uint64_t> upload_counter_{0};
};

} // namespace mpu::storage
