#include "mpu/storage/disk_object_store.hpp"

#include "mpu/util/encoding.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <random>
#include <sstream>
#include <string_view>
#include <system_error>

namespace mpu::storage {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* kUploadManifest = "upload.json";
constexpr const char* kPartSuffix = ".part";

std::string random_hex() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << engine();
    return oss.str();
}

std::int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(std::int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

mpu::Result<json> read_json_file(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return mpu::Err<json>(Error::not_found("Missing file: " + path.string()));
    }
    auto doc = json::parse(input, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return mpu::Err<json>(Error::backend("Corrupt metadata file: " + path.string()));
    }
    return mpu::Ok(std::move(doc));
}

mpu::Result<void> write_text_file(const fs::path& path, const std::string& text) {
    const fs::path temp = path.string() + ".tmp-" + random_hex();
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return mpu::Err<void>(Error::backend("Failed to create " + temp.string()));
        }
        out << text;
        out.flush();
        if (!out) {
            return mpu::Err<void>(Error::backend("Failed to write " + temp.string()));
        }
    }
    std::error_code ec;
    fs::rename(temp, path, ec);
    if (ec) {
        fs::remove(temp, ec);
        return mpu::Err<void>(Error::backend("Failed to move " + temp.string() + " into place"));
    }
    return mpu::Ok();
}

mpu::Result<PartRecord> hash_part_file(const fs::path& path) {
    auto source = stream::FileRangeSource::open(path);
    if (source.is_error()) {
        return mpu::Err<PartRecord>(Error::backend(source.error().message));
    }
    util::Fnv1a hasher;
    std::vector<std::uint8_t> buffer(stream::kDefaultBufferSize);
    PartRecord record;
    while (true) {
        auto read = source.value()->read(buffer.data(), buffer.size());
        if (read.is_error()) {
            return mpu::Err<PartRecord>(Error::backend(read.error().message));
        }
        if (read.value() == 0) {
            break;
        }
        hasher.update(buffer.data(), read.value());
        record.size += read.value();
    }
    record.etag = hasher.hex();
    return mpu::Ok(std::move(record));
}

json metadata_to_json(const ObjectMetadata& metadata) {
    json j;
    j["content_type"] = metadata.content_type;
    j["cache_control"] = metadata.cache_control;
    j["custom"] = metadata.custom;
    return j;
}

ObjectMetadata metadata_from_json(const json& j) {
    ObjectMetadata metadata;
    metadata.content_type = j.value("content_type", std::string(kDefaultContentType));
    metadata.cache_control = j.value("cache_control", std::string{});
    if (j.contains("custom") && j["custom"].is_object()) {
        metadata.custom = j["custom"].get<std::map<std::string, std::string>>();
    }
    return metadata;
}

} // namespace

DiskObjectStore::DiskObjectStore(StoreConfig config)
    : ObjectStoreAdapter(std::move(config)),
      objects_data_root_(this->config().root / "objects" / "data"),
      objects_meta_root_(this->config().root / "objects" / "meta"),
      staging_root_(this->config().root / "staging") {}

mpu::Result<void> DiskObjectStore::initialize() {
    if (config().root.empty()) {
        return mpu::Err<void>(Error::config("Disk backend requires a data root"));
    }
    for (const auto& dir : {objects_data_root_, objects_meta_root_, staging_root_}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec && !fs::exists(dir)) {
            return mpu::Err<void>(Error::backend("Failed to create directory: " + dir.string() + " - " + ec.message()));
        }
    }
    spdlog::info("Disk object store ready at {}", config().root.string());
    return mpu::Ok();
}

std::string DiskObjectStore::next_upload_id() {
    return "disk-" + std::to_string(to_epoch_ms(std::chrono::system_clock::now())) + "-" +
           std::to_string(++upload_counter_) + "-" + random_hex();
}

mpu::Result<std::string> DiskObjectStore::encode_key(const std::string& key) const {
    if (auto valid = validate_key(key); valid.is_error()) {
        return mpu::Err<std::string>(valid.error());
    }
    auto encoded = util::percent_encode(key);
    if (encoded == "." || encoded == "..") {
        return mpu::Err<std::string>(Error::backend("Invalid key: " + key));
    }
    return mpu::Ok(std::move(encoded));
}

fs::path DiskObjectStore::data_path(const std::string& encoded_key) const {
    return objects_data_root_ / encoded_key;
}

fs::path DiskObjectStore::meta_path(const std::string& encoded_key) const {
    return objects_meta_root_ / (encoded_key + ".json");
}

fs::path DiskObjectStore::staging_path(const std::string& upload_id) const {
    return staging_root_ / upload_id;
}

mpu::Result<void> DiskObjectStore::write_atomically(const fs::path& destination,
                                                    const std::vector<std::uint8_t>& bytes) const {
    const fs::path temp = destination.string() + ".tmp-" + random_hex();
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return mpu::Err<void>(Error::backend("Failed to create " + temp.string()));
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            return mpu::Err<void>(Error::backend("Failed to write " + temp.string()));
        }
    }
    std::error_code ec;
    fs::rename(temp, destination, ec);
    if (ec) {
        fs::remove(temp, ec);
        return mpu::Err<void>(Error::backend("Failed to move data into " + destination.string()));
    }
    return mpu::Ok();
}

mpu::Result<void> DiskObjectStore::write_meta(const ObjectInfo& info) const {
    auto encoded = encode_key(info.key);
    if (encoded.is_error()) {
        return mpu::Err<void>(encoded.error());
    }
    json j;
    j["key"] = info.key;
    j["size"] = info.size;
    j["etag"] = info.etag;
    j["content_type"] = info.content_type;
    j["uploaded_at_ms"] = to_epoch_ms(info.uploaded_at);
    return write_text_file(meta_path(encoded.value()), j.dump());
}

mpu::Result<ObjectInfo> DiskObjectStore::read_meta(const std::string& encoded_key) const {
    auto doc = read_json_file(meta_path(encoded_key));
    if (doc.is_error()) {
        return mpu::Err<ObjectInfo>(doc.error());
    }
    const auto& j = doc.value();
    ObjectInfo info;
    info.key = j.value("key", std::string{});
    info.size = j.value("size", std::uint64_t{0});
    info.etag = j.value("etag", std::string{});
    info.content_type = j.value("content_type", std::string(kDefaultContentType));
    info.uploaded_at = from_epoch_ms(j.value("uploaded_at_ms", std::int64_t{0}));
    return mpu::Ok(std::move(info));
}

mpu::Result<std::string> DiskObjectStore::put_object(const std::string& key,
                                                     const std::vector<std::uint8_t>& bytes,
                                                     const ObjectMetadata& metadata) {
    auto encoded = encode_key(key);
    if (encoded.is_error()) {
        return mpu::Err<std::string>(encoded.error());
    }

    ObjectInfo info;
    info.key = key;
    info.size = bytes.size();
    info.etag = util::fnv1a_hex(bytes);
    info.content_type = metadata.content_type;
    info.uploaded_at = std::chrono::system_clock::now();

    std::lock_guard lock(commit_mutex_);
    if (auto res = write_atomically(data_path(encoded.value()), bytes); res.is_error()) {
        return mpu::Err<std::string>(res.error());
    }
    if (auto res = write_meta(info); res.is_error()) {
        return mpu::Err<std::string>(res.error());
    }
    return mpu::Ok(info.etag);
}

mpu::Result<std::string> DiskObjectStore::create_multipart(const std::string& key,
                                                           const ObjectMetadata& metadata) {
    if (auto encoded = encode_key(key); encoded.is_error()) {
        return mpu::Err<std::string>(encoded.error());
    }

    auto upload_id = next_upload_id();
    const auto dir = staging_path(upload_id);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return mpu::Err<std::string>(Error::backend("Failed to create staging directory: " + ec.message()));
    }

    json manifest;
    manifest["key"] = key;
    manifest["metadata"] = metadata_to_json(metadata);
    manifest["created_at_ms"] = to_epoch_ms(std::chrono::system_clock::now());
    if (auto res = write_text_file(dir / kUploadManifest, manifest.dump()); res.is_error()) {
        fs::remove_all(dir, ec);
        return mpu::Err<std::string>(res.error());
    }

    return mpu::Ok(std::move(upload_id));
}

mpu::Result<void> DiskObjectStore::check_upload(const std::string& key, const std::string& upload_id) const {
    if (upload_id.empty() || upload_id.find('/') != std::string::npos || upload_id.find("..") != std::string::npos) {
        return mpu::Err<void>(Error::backend("NoSuchUpload: " + upload_id));
    }
    auto manifest = read_json_file(staging_path(upload_id) / kUploadManifest);
    if (manifest.is_error()) {
        return mpu::Err<void>(Error::backend("NoSuchUpload: " + upload_id));
    }
    if (manifest.value().value("key", std::string{}) != key) {
        return mpu::Err<void>(Error::backend("Upload " + upload_id + " does not belong to key " + key));
    }
    return mpu::Ok();
}

mpu::Result<std::string> DiskObjectStore::upload_part(const std::string& key,
                                                      const std::string& upload_id,
                                                      std::uint32_t part_number,
                                                      const std::vector<std::uint8_t>& bytes) {
    if (auto valid = validate_part_number(part_number); valid.is_error()) {
        return mpu::Err<std::string>(valid.error());
    }
    if (auto valid = check_upload(key, upload_id); valid.is_error()) {
        return mpu::Err<std::string>(valid.error());
    }

    const auto destination = staging_path(upload_id) / (std::to_string(part_number) + kPartSuffix);
    if (auto res = write_atomically(destination, bytes); res.is_error()) {
        return mpu::Err<std::string>(res.error());
    }
    return mpu::Ok(util::fnv1a_hex(bytes));
}

mpu::Result<ObjectInfo> DiskObjectStore::do_complete_multipart(const std::string& key,
                                                               const std::string& upload_id,
                                                               const std::vector<CompletedPart>& sorted_parts) {
    auto encoded = encode_key(key);
    if (encoded.is_error()) {
        return mpu::Err<ObjectInfo>(encoded.error());
    }

    std::lock_guard lock(commit_mutex_);
    if (auto valid = check_upload(key, upload_id); valid.is_error()) {
        return mpu::Err<ObjectInfo>(valid.error());
    }

    const auto dir = staging_path(upload_id);
    auto manifest = read_json_file(dir / kUploadManifest);
    if (manifest.is_error()) {
        return mpu::Err<ObjectInfo>(Error::backend("NoSuchUpload: " + upload_id));
    }
    const ObjectMetadata metadata = metadata_from_json(manifest.value().value("metadata", json::object()));

    std::map<std::uint32_t, PartRecord> uploaded;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        const auto name = entry.path().filename().string();
        if (name.size() <= std::string(kPartSuffix).size() ||
            name.compare(name.size() - std::string(kPartSuffix).size(), std::string::npos, kPartSuffix) != 0) {
            continue;
        }
        const auto number_text = name.substr(0, name.size() - std::string(kPartSuffix).size());
        if (!std::all_of(number_text.begin(), number_text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            continue;
        }
        auto record = hash_part_file(entry.path());
        if (record.is_error()) {
            return mpu::Err<ObjectInfo>(record.error());
        }
        uploaded.emplace(static_cast<std::uint32_t>(std::stoul(number_text)), std::move(record.value()));
    }
    if (ec) {
        return mpu::Err<ObjectInfo>(Error::backend("Failed to scan staging directory: " + ec.message()));
    }

    if (auto valid = validate_completion(sorted_parts, uploaded); valid.is_error()) {
        return mpu::Err<ObjectInfo>(valid.error());
    }

    const fs::path destination = data_path(encoded.value());
    const fs::path assembled = objects_data_root_ / (".assemble-" + upload_id);
    {
        auto sink = stream::FileSink::create(assembled);
        if (sink.is_error()) {
            return mpu::Err<ObjectInfo>(Error::backend(sink.error().message));
        }
        for (const auto& part : sorted_parts) {
            auto source = stream::FileRangeSource::open(dir / (std::to_string(part.part_number) + kPartSuffix));
            if (source.is_error()) {
                fs::remove(assembled, ec);
                return mpu::Err<ObjectInfo>(Error::backend(source.error().message));
            }
            auto copied = stream::pipe(*source.value(), *sink.value());
            if (copied.is_error()) {
                fs::remove(assembled, ec);
                return mpu::Err<ObjectInfo>(Error::backend(copied.error().message));
            }
        }
        if (auto closed = sink.value()->close(); closed.is_error()) {
            fs::remove(assembled, ec);
            return mpu::Err<ObjectInfo>(Error::backend(closed.error().message));
        }
    }

    fs::rename(assembled, destination, ec);
    if (ec) {
        fs::remove(assembled, ec);
        return mpu::Err<ObjectInfo>(Error::backend("Failed to commit object " + key));
    }

    ObjectInfo info;
    info.key = key;
    info.etag = multipart_etag(sorted_parts);
    info.content_type = metadata.content_type;
    info.uploaded_at = std::chrono::system_clock::now();
    for (const auto& [number, record] : uploaded) {
        info.size += record.size;
    }
    if (auto res = write_meta(info); res.is_error()) {
        return mpu::Err<ObjectInfo>(res.error());
    }

    fs::remove_all(dir, ec);
    if (ec) {
        spdlog::warn("Failed to clean staging directory {}: {}", dir.string(), ec.message());
    }
    return mpu::Ok(std::move(info));
}

mpu::Result<void> DiskObjectStore::abort_multipart(const std::string& key, const std::string& upload_id) {
    std::lock_guard lock(commit_mutex_);
    auto valid = check_upload(key, upload_id);
    if (valid.is_error()) {
        if (!fs::exists(staging_path(upload_id) / kUploadManifest)) {
            spdlog::debug("Abort of unknown upload {} for {} ignored", upload_id, key);
            return mpu::Ok();
        }
        return valid;
    }

    std::error_code ec;
    fs::remove_all(staging_path(upload_id), ec);
    if (ec) {
        return mpu::Err<void>(Error::backend("Failed to release parts of " + upload_id + ": " + ec.message()));
    }
    return mpu::Ok();
}

mpu::Result<ObjectInfo> DiskObjectStore::head_object(const std::string& key) {
    auto encoded = encode_key(key);
    if (encoded.is_error()) {
        return mpu::Err<ObjectInfo>(encoded.error());
    }
    auto info = read_meta(encoded.value());
    if (info.is_error() && info.error().code == ErrorCode::NotFound) {
        return mpu::Err<ObjectInfo>(Error::not_found("Object not found: " + key));
    }
    return info;
}

mpu::Result<ObjectReader> DiskObjectStore::open_object(const std::string& key) {
    auto info = head_object(key);
    if (info.is_error()) {
        return mpu::Err<ObjectReader>(info.error());
    }
    auto encoded = encode_key(key);
    auto source = stream::FileRangeSource::open(data_path(encoded.value()));
    if (source.is_error()) {
        return mpu::Err<ObjectReader>(Error::not_found("Object not found: " + key));
    }

    ObjectReader reader;
    reader.info = std::move(info.value());
    reader.info.size = source.value()->size_hint().value_or(reader.info.size);
    reader.body = std::move(source.value());
    return mpu::Ok(std::move(reader));
}

mpu::Result<ObjectData> DiskObjectStore::get_object(const std::string& key) {
    auto reader = open_object(key);
    if (reader.is_error()) {
        return mpu::Err<ObjectData>(reader.error());
    }
    auto bytes = stream::read_all(*reader.value().body, reader.value().info.size);
    if (bytes.is_error()) {
        return mpu::Err<ObjectData>(Error::backend(bytes.error().message));
    }

    ObjectData data;
    data.bytes = std::move(bytes.value());
    data.size = data.bytes.size();
    data.content_type = reader.value().info.content_type;
    data.etag = reader.value().info.etag;
    return mpu::Ok(std::move(data));
}

mpu::Result<std::vector<ObjectInfo>> DiskObjectStore::list_objects() {
    std::vector<ObjectInfo> items;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(objects_meta_root_, ec)) {
        const auto name = entry.path().filename().string();
        constexpr std::string_view suffix = ".json";
        if (name.size() <= suffix.size() || name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        auto info = read_meta(name.substr(0, name.size() - suffix.size()));
        if (info.is_error()) {
            spdlog::warn("Skipping unreadable object metadata {}: {}", name, info.error().message);
            continue;
        }
        items.push_back(std::move(info.value()));
    }
    if (ec) {
        return mpu::Err<std::vector<ObjectInfo>>(Error::backend("Failed to list objects: " + ec.message()));
    }

    std::sort(items.begin(), items.end(), [](const ObjectInfo& a, const ObjectInfo& b) {
        return a.key < b.key;
    });
    return mpu::Ok(std::move(items));
}

} // namespace mpu::storage
