#include "mpu/config/relay_config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>
#include <limits>
#include <sstream>

namespace mpu::config {

using json = nlohmann::json;

namespace {

template<typename T>
mpu::Result<T> parse_unsigned(const std::string& text, const std::string& flag) {
    T value{};
    const char* first = text.data();
    const char* last = first + text.size();
    auto [end, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || end != last) {
        return mpu::Err<T>(Error::config("Invalid value for " + flag + ": '" + text + "'"));
    }
    return mpu::Ok(value);
}

template<typename T>
mpu::Result<T> json_unsigned(const json& doc, const char* key, T current) {
    auto it = doc.find(key);
    if (it == doc.end()) {
        return mpu::Ok(current);
    }
    if (!it->is_number_unsigned() || it->get<std::uint64_t>() > std::numeric_limits<T>::max()) {
        return mpu::Err<T>(Error::config(std::string("Config key '") + key + "' must be a non-negative integer"));
    }
    return mpu::Ok(static_cast<T>(it->get<std::uint64_t>()));
}

mpu::Result<std::string> json_string(const json& doc, const char* key, std::string current) {
    auto it = doc.find(key);
    if (it == doc.end()) {
        return mpu::Ok(std::move(current));
    }
    if (!it->is_string()) {
        return mpu::Err<std::string>(Error::config(std::string("Config key '") + key + "' must be a string"));
    }
    return mpu::Ok(it->get<std::string>());
}

bool is_log_level(const std::string& level) {
    static const char* const kLevels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    for (const char* name : kLevels) {
        if (level == name) {
            return true;
        }
    }
    return false;
}

} // namespace

const char* to_string(BackendKind kind) noexcept {
    switch (kind) {
        case BackendKind::Memory: return "memory";
        case BackendKind::Disk: return "disk";
    }
    return "unknown";
}

std::optional<BackendKind> parse_backend(const std::string& text) noexcept {
    if (text == "memory") return BackendKind::Memory;
    if (text == "disk") return BackendKind::Disk;
    return std::nullopt;
}

storage::StoreConfig RelayConfig::store_config() const {
    storage::StoreConfig store;
    store.root = data_root;
    store.min_part_size = min_part_size;
    store.max_parts = max_parts;
    return store;
}

upload::PlannerLimits RelayConfig::planner_limits() const {
    upload::PlannerLimits limits;
    limits.min_part_size = min_part_size;
    limits.max_parts = max_parts;
    return limits;
}

mpu::Result<void> RelayConfig::validate() const {
    if (bind_address.empty()) {
        return mpu::Err<void>(Error::config("Bind address must not be empty"));
    }
    if (chunk_size < min_part_size) {
        return mpu::Err<void>(Error::config("Chunk size " + std::to_string(chunk_size) +
                                            " is below the minimum part size of " +
                                            std::to_string(min_part_size) + " bytes"));
    }
    if (max_parts == 0) {
        return mpu::Err<void>(Error::config("max_parts must be at least 1"));
    }
    if (threads == 0) {
        return mpu::Err<void>(Error::config("threads must be at least 1"));
    }
    if (backend == BackendKind::Disk && data_root.empty()) {
        return mpu::Err<void>(Error::config("The disk backend needs a data directory"));
    }
    if (idle_timeout == 0) {
        return mpu::Err<void>(Error::config("idle_timeout must be at least 1 second"));
    }
    if (!is_log_level(log_level)) {
        return mpu::Err<void>(Error::config("Unknown log level: " + log_level));
    }
    if (!public_url.empty() && public_url.compare(0, 7, "http://") != 0) {
        return mpu::Err<void>(Error::config("public_url must start with http://"));
    }
    return mpu::Ok();
}

mpu::Result<void> RelayConfig::apply_json(const std::string& text) {
    auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return mpu::Err<void>(Error::config("Config file is not a JSON object"));
    }

    // Applied to a copy so that a bad key leaves the config untouched
    RelayConfig next = *this;

    if (auto v = json_string(doc, "bind", next.bind_address); v.is_error()) {
        return mpu::Err<void>(v.error());
    } else {
        next.bind_address = v.value();
    }
    if (auto v = json_unsigned<std::uint16_t>(doc, "port", next.port); v.is_error()) {
        return mpu::Err<void>(v.error());
    } else {
        next.port = v.value();
    }
    if (auto v = json_string(doc, "backend", to_string(next.backend)); v.is_error()) {
        return mpu::Err<void>(v.error());
    } else if (auto kind = parse_backend(v.value()); !kind) {
        return mpu::Err<void>(Error::config("Unknown backend: " + v.value()));
    } else {
        next.backend = *kind;
    }
    if (auto v = json_string(doc, "data_dir", next.data_root.string()); v.is_error()) {
        return mpu::Err<void>(v.error());
    } else {
        next.data_root = v.value();
    }
    if (auto v = json_string(doc, "public_url", next.public_url); v.is_error()) {
        return mpu::Err<void>(v.error());
    } else {
        next.public_url = v.value();
    }
    if (auto v = json_unsigned<std::uint64_t>(doc, "chunk_size", next.chunk_size); v.is_error()) {
        return mpu::Err<void>(v.error());
    } else {
        next.chunk_size = v.value();
    }
    if (auto v = json_unsigned<std::uint64_t>(doc, "min_part_size", next.min_part_size); v.is_error()) {
        return mpu::Err<void>(v.error());
    } else {
        next.min_part_size = v.value();
    }
    if (auto v = json_unsigned<std::uint32_t>(doc, "max_parts", next.max_parts); v.is_error()) {
        return mpu::Err<void>(v.error());
    } else {
        next.max_parts = v.value();
    }
    if (auto v = json_unsigned<unsigned>(doc, "threads", next.threads); v.is_error()) {
        return mpu::Err<void>(v.error());
    } else {
        next.threads = v.value();
    }
    if (auto v = json_unsigned<std::uint64_t>(doc, "idle_timeout", next.idle_timeout); v.is_error()) {
        return mpu::Err<void>(v.error());
    } else {
        next.idle_timeout = v.value();
    }
    if (auto v = json_string(doc, "log_level", next.log_level); v.is_error()) {
        return mpu::Err<void>(v.error());
    } else {
        next.log_level = v.value();
    }

    *this = std::move(next);
    return mpu::Ok();
}

mpu::Result<void> RelayConfig::apply_file(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return mpu::Err<void>(Error::config("Cannot open config file: " + path.string()));
    }
    std::stringstream buffer;
    buffer << input.rdbuf();

    auto applied = apply_json(buffer.str());
    if (applied.is_error()) {
        return mpu::Err<void>(Error::config(path.string() + ": " + applied.error().message));
    }
    spdlog::debug("Loaded configuration from {}", path.string());
    return mpu::Ok();
}

mpu::Result<RelayConfig> RelayConfig::from_args(const std::vector<std::string>& args) {
    RelayConfig config;

    // --config is applied first so that flags override the file
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                return mpu::Err<RelayConfig>(Error::config("--config needs a value"));
            }
            auto applied = config.apply_file(args[i + 1]);
            if (applied.is_error()) {
                return mpu::Err<RelayConfig>(applied.error());
            }
        }
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        const bool has_value = i + 1 < args.size();
        auto missing = [&arg]() {
            return mpu::Err<RelayConfig>(Error::config(arg + " needs a value"));
        };

        if (arg == "--config") {
            ++i;
        } else if (arg == "-p" || arg == "--port") {
            if (!has_value) return missing();
            auto port = parse_unsigned<std::uint16_t>(args[++i], arg);
            if (port.is_error()) return mpu::Err<RelayConfig>(port.error());
            config.port = port.value();
        } else if (arg == "--bind") {
            if (!has_value) return missing();
            config.bind_address = args[++i];
        } else if (arg == "--backend") {
            if (!has_value) return missing();
            auto kind = parse_backend(args[++i]);
            if (!kind) {
                return mpu::Err<RelayConfig>(Error::config("Unknown backend: " + args[i]));
            }
            config.backend = *kind;
        } else if (arg == "-d" || arg == "--data") {
            if (!has_value) return missing();
            config.data_root = args[++i];
        } else if (arg == "--public-url") {
            if (!has_value) return missing();
            config.public_url = args[++i];
        } else if (arg == "--chunk-size") {
            if (!has_value) return missing();
            auto chunk = parse_unsigned<std::uint64_t>(args[++i], arg);
            if (chunk.is_error()) return mpu::Err<RelayConfig>(chunk.error());
            config.chunk_size = chunk.value();
        } else if (arg == "--threads") {
            if (!has_value) return missing();
            auto threads = parse_unsigned<unsigned>(args[++i], arg);
            if (threads.is_error()) return mpu::Err<RelayConfig>(threads.error());
            config.threads = threads.value();
        } else if (arg == "--idle-timeout") {
            if (!has_value) return missing();
            auto seconds = parse_unsigned<std::uint64_t>(args[++i], arg);
            if (seconds.is_error()) return mpu::Err<RelayConfig>(seconds.error());
            config.idle_timeout = seconds.value();
        } else if (arg == "--log-level") {
            if (!has_value) return missing();
            config.log_level = args[++i];
        } else {
            return mpu::Err<RelayConfig>(Error::config("Unknown argument: " + arg));
        }
    }

    while (!config.public_url.empty() && config.public_url.back() == '/') {
        config.public_url.pop_back();
    }

    auto valid = config.validate();
    if (valid.is_error()) {
        return mpu::Err<RelayConfig>(valid.error());
    }
    return mpu::Ok(std::move(config));
}

mpu::Result<RelayConfig> RelayConfig::from_args(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return from_args(args);
}

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "  --config <file>        JSON configuration file\n"
        << "  -p, --port <port>      Listen port (default 8080, 0 = ephemeral)\n"
        << "  --bind <address>       Listen address (default 0.0.0.0)\n"
        << "  --backend <kind>       memory | disk (default disk)\n"
        << "  -d, --data <dir>       Data directory for the disk backend\n"
        << "  --public-url <url>     Base URL written into part URLs\n"
        << "  --chunk-size <bytes>   Part size (default 10 MiB)\n"
        << "  --threads <n>          io_context threads (default 1)\n"
        << "  --idle-timeout <sec>   Abort multipart uploads idle this long (default 86400)\n"
        << "  --log-level <level>    trace | debug | info | warn | error\n";
    return oss.str();
}

} // namespace mpu::config
