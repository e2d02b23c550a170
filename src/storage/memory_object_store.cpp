#include "mpu/storage/memory_object_store.hpp"

#include "mpu/util/encoding.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <random>
#include <sstream>

namespace mpu::storage {
namespace {

std::string random_suffix() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << engine();
    return oss.str();
}

} // namespace

MemoryObjectStore::MemoryObjectStore(StoreConfig config)
    : ObjectStoreAdapter(std::move(config)) {}

std::string MemoryObjectStore::next_upload_id() {
    return "mem-" + std::to_string(++upload_counter_) + "-" + random_suffix();
}

mpu::Result<std::string> MemoryObjectStore::put_object(const std::string& key,
                                                       const std::vector<std::uint8_t>& bytes,
                                                       const ObjectMetadata& metadata) {
    if (auto valid = validate_key(key); valid.is_error()) {
        return mpu::Err<std::string>(valid.error());
    }

    StoredObject object;
    object.data = std::make_shared<const std::vector<std::uint8_t>>(bytes);
    object.info.key = key;
    object.info.size = bytes.size();
    object.info.uploaded_at = std::chrono::system_clock::now();
    object.info.etag = util::fnv1a_hex(bytes);
    object.info.content_type = metadata.content_type;

    const std::string etag = object.info.etag;
    std::lock_guard lock(mutex_);
    objects_[key] = std::move(object);
    return mpu::Ok(etag);
}

mpu::Result<std::string> MemoryObjectStore::create_multipart(const std::string& key,
                                                             const ObjectMetadata& metadata) {
    if (auto valid = validate_key(key); valid.is_error()) {
        return mpu::Err<std::string>(valid.error());
    }

    auto upload_id = next_upload_id();
    std::lock_guard lock(mutex_);
    uploads_.emplace(upload_id, PendingUpload{key, metadata, {}});
    return mpu::Ok(std::move(upload_id));
}

mpu::Result<std::string> MemoryObjectStore::upload_part(const std::string& key,
                                                        const std::string& upload_id,
                                                        std::uint32_t part_number,
                                                        const std::vector<std::uint8_t>& bytes) {
    if (auto valid = validate_part_number(part_number); valid.is_error()) {
        return mpu::Err<std::string>(valid.error());
    }

    StoredPart part;
    part.data = std::make_shared<const std::vector<std::uint8_t>>(bytes);
    part.record.etag = util::fnv1a_hex(bytes);
    part.record.size = bytes.size();
    const std::string etag = part.record.etag;

    std::lock_guard lock(mutex_);
    auto it = uploads_.find(upload_id);
    if (it == uploads_.end() || it->second.key != key) {
        return mpu::Err<std::string>(Error::backend("NoSuchUpload: " + upload_id));
    }
    it->second.parts[part_number] = std::move(part);
    return mpu::Ok(etag);
}

mpu::Result<ObjectInfo> MemoryObjectStore::do_complete_multipart(const std::string& key,
                                                                 const std::string& upload_id,
                                                                 const std::vector<CompletedPart>& sorted_parts) {
    std::lock_guard lock(mutex_);
    auto it = uploads_.find(upload_id);
    if (it == uploads_.end() || it->second.key != key) {
        return mpu::Err<ObjectInfo>(Error::backend("NoSuchUpload: " + upload_id));
    }

    std::map<std::uint32_t, PartRecord> uploaded;
    std::uint64_t total = 0;
    for (const auto& [number, part] : it->second.parts) {
        uploaded.emplace(number, part.record);
        total += part.record.size;
    }
    if (auto valid = validate_completion(sorted_parts, uploaded); valid.is_error()) {
        return mpu::Err<ObjectInfo>(valid.error());
    }

    auto data = std::make_shared<std::vector<std::uint8_t>>();
    data->reserve(static_cast<std::size_t>(total));
    for (const auto& part : sorted_parts) {
        const auto& bytes = *it->second.parts.at(part.part_number).data;
        data->insert(data->end(), bytes.begin(), bytes.end());
    }

    StoredObject object;
    object.info.key = key;
    object.info.size = data->size();
    object.info.uploaded_at = std::chrono::system_clock::now();
    object.info.etag = multipart_etag(sorted_parts);
    object.info.content_type = it->second.metadata.content_type;
    object.data = std::move(data);

    ObjectInfo info = object.info;
    objects_[key] = std::move(object);
    uploads_.erase(it);
    return mpu::Ok(std::move(info));
}

mpu::Result<void> MemoryObjectStore::abort_multipart(const std::string& key, const std::string& upload_id) {
    std::lock_guard lock(mutex_);
    auto it = uploads_.find(upload_id);
    if (it == uploads_.end()) {
        spdlog::debug("Abort of unknown upload {} for {} ignored", upload_id, key);
        return mpu::Ok();
    }
    if (it->second.key != key) {
        return mpu::Err<void>(Error::backend("Upload " + upload_id + " does not belong to key " + key));
    }
    uploads_.erase(it);
    return mpu::Ok();
}

mpu::Result<ObjectData> MemoryObjectStore::get_object(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return mpu::Err<ObjectData>(Error::not_found("Object not found: " + key));
    }
    ObjectData data;
    data.bytes = *it->second.data;
    data.size = it->second.info.size;
    data.content_type = it->second.info.content_type;
    data.etag = it->second.info.etag;
    return mpu::Ok(std::move(data));
}

mpu::Result<ObjectReader> MemoryObjectStore::open_object(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return mpu::Err<ObjectReader>(Error::not_found("Object not found: " + key));
    }
    ObjectReader reader;
    reader.info = it->second.info;
    reader.body = std::make_unique<stream::MemorySource>(it->second.data);
    return mpu::Ok(std::move(reader));
}

mpu::Result<ObjectInfo> MemoryObjectStore::head_object(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return mpu::Err<ObjectInfo>(Error::not_found("Object not found: " + key));
    }
    return mpu::Ok(it->second.info);
}

mpu::Result<std::vector<ObjectInfo>> MemoryObjectStore::list_objects() {
    std::vector<ObjectInfo> items;
    {
        std::lock_guard lock(mutex_);
        items.reserve(objects_.size());
        for (const auto& [key, object] : objects_) {
            items.push_back(object.info);
        }
    }
    std::sort(items.begin(), items.end(), [](const ObjectInfo& a, const ObjectInfo& b) {
        return a.key < b.key;
    });
    return mpu::Ok(std::move(items));
}

std::size_t MemoryObjectStore::pending_upload_count() const {
    std::lock_guard lock(mutex_);
    return uploads_.size();
}

std::size_t MemoryObjectStore::pending_part_count(const std::string& upload_id) const {
    std::lock_guard lock(mutex_);
    auto it = uploads_.find(upload_id);
    return it == uploads_.end() ? 0 : it->second.parts.size();
}

} // namespace mpu::storage
