#include "mpu/config/relay_config.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using mpu::ErrorCode;
using mpu::config::BackendKind;
using mpu::config::RelayConfig;

namespace {

fs::path write_config(const std::string& content) {
    static std::atomic<uint64_t> counter{0};
    const auto dir = fs::temp_directory_path() / ("mpu_relay_config_test_" + std::to_string(counter.fetch_add(1)));
    fs::create_directories(dir);
    const auto path = dir / "relay.json";
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST(RelayConfigTest, Defaults) {
    auto config = RelayConfig::from_args(std::vector<std::string>{});

    ASSERT_TRUE(config.is_ok()) << config.error().message;
    EXPECT_EQ(config.value().bind_address, "0.0.0.0");
    EXPECT_EQ(config.value().port, 8080);
    EXPECT_EQ(config.value().backend, BackendKind::Disk);
    EXPECT_EQ(config.value().chunk_size, 10u * 1024 * 1024);
    EXPECT_EQ(config.value().min_part_size, 5u * 1024 * 1024);
    EXPECT_EQ(config.value().max_parts, 10000u);
    EXPECT_EQ(config.value().max_body_size(), 11u * 1024 * 1024);
    EXPECT_EQ(config.value().idle_timeout, 86400u);
}

TEST(RelayConfigTest, FlagsOverrideDefaults) {
    auto config = RelayConfig::from_args({"-p", "0", "--backend", "memory", "--bind", "127.0.0.1",
                                          "--chunk-size", "6291456", "--threads", "4",
                                          "--public-url", "http://relay.example:9000/", "--log-level", "debug",
                                          "--idle-timeout", "3600"});

    ASSERT_TRUE(config.is_ok()) << config.error().message;
    EXPECT_EQ(config.value().port, 0);
    EXPECT_EQ(config.value().backend, BackendKind::Memory);
    EXPECT_EQ(config.value().bind_address, "127.0.0.1");
    EXPECT_EQ(config.value().chunk_size, 6291456u);
    EXPECT_EQ(config.value().threads, 4u);
    EXPECT_EQ(config.value().public_url, "http://relay.example:9000");
    EXPECT_EQ(config.value().log_level, "debug");
    EXPECT_EQ(config.value().idle_timeout, 3600u);
}

TEST(RelayConfigTest, BadFlagsAreConfigErrors) {
    const std::vector<std::vector<std::string>> cases = {
        {"--frobnicate"},
        {"--port"},
        {"--port", "70000"},
        {"--port", "12ab"},
        {"--backend", "s3"},
        {"--chunk-size", "1024"},
        {"--threads", "0"},
        {"--log-level", "loud"},
        {"--public-url", "ftp://relay"},
        {"--idle-timeout", "0"},
    };
    for (const auto& args : cases) {
        auto config = RelayConfig::from_args(args);
        ASSERT_TRUE(config.is_error()) << args[0];
        EXPECT_EQ(config.error().code, ErrorCode::Config) << args[0];
    }
}

TEST(RelayConfigTest, ConfigFileThenFlags) {
    const auto path = write_config(R"({
        "port": 9000,
        "backend": "memory",
        "chunk_size": 8388608,
        "max_parts": 500,
        "log_level": "warn",
        "idle_timeout": 600
    })");

    auto config = RelayConfig::from_args({"--port", "9100", "--config", path.string()});

    ASSERT_TRUE(config.is_ok()) << config.error().message;
    EXPECT_EQ(config.value().port, 9100);
    EXPECT_EQ(config.value().backend, BackendKind::Memory);
    EXPECT_EQ(config.value().chunk_size, 8388608u);
    EXPECT_EQ(config.value().max_parts, 500u);
    EXPECT_EQ(config.value().planner_limits().max_parts, 500u);
    EXPECT_EQ(config.value().store_config().max_parts, 500u);
    EXPECT_EQ(config.value().log_level, "warn");
    EXPECT_EQ(config.value().idle_timeout, 600u);

    fs::remove_all(path.parent_path());
}

TEST(RelayConfigTest, MissingConfigFile) {
    auto config = RelayConfig::from_args({"--config", "/nonexistent/relay.json"});

    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error().code, ErrorCode::Config);
    EXPECT_NE(config.error().message.find("Cannot open config file"), std::string::npos);
}

TEST(RelayConfigTest, ApplyJsonRejectsBadDocumentsWithoutChanges) {
    RelayConfig config;

    EXPECT_TRUE(config.apply_json("not json").is_error());
    EXPECT_TRUE(config.apply_json("[1, 2]").is_error());

    auto wrong_type = config.apply_json(R"({"port": 9000, "chunk_size": "big"})");
    ASSERT_TRUE(wrong_type.is_error());
    EXPECT_NE(wrong_type.error().message.find("chunk_size"), std::string::npos);
    EXPECT_EQ(config.port, 8080);

    EXPECT_TRUE(config.apply_json(R"({"port": -1})").is_error());
    EXPECT_TRUE(config.apply_json(R"({"port": 65536})").is_error());
    EXPECT_TRUE(config.apply_json(R"({"backend": "tape"})").is_error());
    EXPECT_EQ(config.backend, BackendKind::Disk);
}

TEST(RelayConfigTest, ApplyJsonKeepsAbsentKeys) {
    RelayConfig config;
    config.port = 1234;

    ASSERT_TRUE(config.apply_json(R"({"data_dir": "/var/lib/relay"})").is_ok());

    EXPECT_EQ(config.port, 1234);
    EXPECT_EQ(config.data_root, fs::path("/var/lib/relay"));
    EXPECT_EQ(config.store_config().root, fs::path("/var/lib/relay"));
}

TEST(RelayConfigTest, Validate) {
    RelayConfig config;
    EXPECT_TRUE(config.validate().is_ok());

    config.chunk_size = config.min_part_size - 1;
    auto small = config.validate();
    ASSERT_TRUE(small.is_error());
    EXPECT_NE(small.error().message.find("minimum part size"), std::string::npos);

    config = RelayConfig{};
    config.max_parts = 0;
    EXPECT_TRUE(config.validate().is_error());

    config = RelayConfig{};
    config.data_root.clear();
    EXPECT_TRUE(config.validate().is_error());
    config.backend = BackendKind::Memory;
    EXPECT_TRUE(config.validate().is_ok());
}

TEST(RelayConfigTest, BackendNames) {
    EXPECT_STREQ(mpu::config::to_string(BackendKind::Memory), "memory");
    EXPECT_EQ(mpu::config::parse_backend("disk"), BackendKind::Disk);
    EXPECT_FALSE(mpu::config::parse_backend("Disk").has_value());
}
