#pragma once

#include "mpu/core/result.hpp"
#include "mpu/storage/object_store.hpp"
#include "mpu/upload/part_planner.hpp"
#include "mpu/upload/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mpu::config {

enum class BackendKind {
    Memory,
    Disk
};

const char* to_string(BackendKind kind) noexcept;
std::optional<BackendKind> parse_backend(const std::string& text) noexcept;

/**
 * @brief Settings of the relay server
 *
 * Sources, later ones winning: built-in defaults, the JSON file named by
 * --config, then the remaining command-line flags.
 *
 * JSON file keys: bind, port, backend, data_dir, public_url, chunk_size,
 * min_part_size, max_parts, threads, log_level, idle_timeout (seconds).
 */
struct RelayConfig {
    std::string bind_address = "0.0.0.0";
    std::uint16_t port = 8080;
    BackendKind backend = BackendKind::Disk;
    std::filesystem::path data_root = "relay_data";
    std::string public_url;
    std::uint64_t chunk_size = upload::kDefaultChunkSize;
    std::uint64_t min_part_size = upload::kMinPartSize;
    std::uint32_t max_parts = upload::kMaxParts;
    unsigned threads = 1;
    std::string log_level = "info";

    /// Seconds a multipart upload may sit without activity before the relay aborts it
    std::uint64_t idle_timeout = 24 * 60 * 60;

    /// Largest request body the server buffers: one part plus 1 MiB of slack
    std::uint64_t max_body_size() const noexcept { return chunk_size + upload::kMiB; }

    storage::StoreConfig store_config() const;
    upload::PlannerLimits planner_limits() const;

    mpu::Result<void> validate() const;

    /**
     * @brief Overlay the keys present in a JSON document
     */
    mpu::Result<void> apply_json(const std::string& text);

    mpu::Result<void> apply_file(const std::filesystem::path& path);

    /**
     * @brief Defaults, then --config, then the other flags; validated
     */
    static mpu::Result<RelayConfig> from_args(const std::vector<std::string>& args);
    static mpu::Result<RelayConfig> from_args(int argc, char* argv[]);
};

std::string usage(const std::string& program);

} // namespace mpu::config
