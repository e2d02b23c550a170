#include "mpu/storage/object_store.hpp"

#include "mpu/util/encoding.hpp"

#include <algorithm>

namespace mpu::storage {

mpu::Result<ObjectInfo> ObjectStoreAdapter::complete_multipart(const std::string& key,
                                                               const std::string& upload_id,
                                                               std::vector<CompletedPart> parts) {
    std::stable_sort(parts.begin(), parts.end(), [](const CompletedPart& a, const CompletedPart& b) {
        return a.part_number < b.part_number;
    });
    return do_complete_multipart(key, upload_id, parts);
}

mpu::Result<void> ObjectStoreAdapter::validate_key(const std::string& key) {
    if (key.empty()) {
        return mpu::Err<void>(Error::backend("Invalid key: key must not be empty"));
    }
    if (key.size() > kMaxKeyLength) {
        return mpu::Err<void>(Error::backend("Invalid key: longer than " + std::to_string(kMaxKeyLength) + " bytes"));
    }
    if (key.find('\0') != std::string::npos) {
        return mpu::Err<void>(Error::backend("Invalid key: contains NUL byte"));
    }
    return mpu::Ok();
}

std::string ObjectStoreAdapter::strip_etag_quotes(const std::string& etag) {
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
        return etag.substr(1, etag.size() - 2);
    }
    return etag;
}

std::string ObjectStoreAdapter::multipart_etag(const std::vector<CompletedPart>& sorted_parts) {
    util::Fnv1a hasher;
    for (const auto& part : sorted_parts) {
        const auto etag = strip_etag_quotes(part.etag);
        hasher.update(reinterpret_cast<const std::uint8_t*>(etag.data()), etag.size());
    }
    return hasher.hex() + "-" + std::to_string(sorted_parts.size());
}

mpu::Result<void> ObjectStoreAdapter::validate_part_number(std::uint32_t part_number) const {
    if (part_number < 1 || part_number > config_.max_parts) {
        return mpu::Err<void>(Error::backend("Invalid part number " + std::to_string(part_number) +
                                             ": must be between 1 and " + std::to_string(config_.max_parts)));
    }
    return mpu::Ok();
}

mpu::Result<void> ObjectStoreAdapter::validate_completion(
    const std::vector<CompletedPart>& sorted_parts,
    const std::map<std::uint32_t, PartRecord>& uploaded) const {

    if (sorted_parts.empty()) {
        return mpu::Err<void>(Error::backend("Completion request lists no parts"));
    }

    for (std::size_t i = 0; i < sorted_parts.size(); ++i) {
        const auto& part = sorted_parts[i];
        const auto expected_number = static_cast<std::uint32_t>(i + 1);

        if (i > 0 && part.part_number == sorted_parts[i - 1].part_number) {
            return mpu::Err<void>(Error::backend("Duplicate part number " + std::to_string(part.part_number)));
        }
        if (part.part_number != expected_number) {
            return mpu::Err<void>(Error::backend("Missing part number " + std::to_string(expected_number)));
        }

        const auto it = uploaded.find(part.part_number);
        if (it == uploaded.end()) {
            return mpu::Err<void>(Error::backend("Part " + std::to_string(part.part_number) + " was never uploaded"));
        }
        if (strip_etag_quotes(part.etag) != it->second.etag) {
            return mpu::Err<void>(Error::backend("ETag mismatch for part " + std::to_string(part.part_number)));
        }

        const bool is_last = i + 1 == sorted_parts.size();
        if (!is_last && it->second.size < config_.min_part_size) {
            return mpu::Err<void>(Error::backend("Part " + std::to_string(part.part_number) + " is smaller than " +
                                                 std::to_string(config_.min_part_size) + " bytes"));
        }
    }

    if (uploaded.size() != sorted_parts.size()) {
        return mpu::Err<void>(Error::backend("Completion lists " + std::to_string(sorted_parts.size()) +
                                             " parts but " + std::to_string(uploaded.size()) + " were uploaded"));
    }

    return mpu::Ok();
}

} // namespace mpu::storage
