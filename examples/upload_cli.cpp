/**
 * @file upload_cli.cpp
 * @brief Command-line client for the relay
 *
 * Usage:
 *   mpu_upload [--relay URL] [--retries N] [--log-level L] upload <file> [key]
 *   mpu_upload [--relay URL] list
 *   mpu_upload [--relay URL] download <key> <destination>
 */

#include "mpu/client/relay_transport.hpp"
#include "mpu/client/upload_client.hpp"
#include "mpu/stream/byte_stream.hpp"
#include "mpu/util/encoding.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <command>\n"
              << "Options:\n"
              << "  --relay <url>          Relay base URL (default http://127.0.0.1:8080)\n"
              << "  --retries <n>          Extra attempts per part on network errors\n"
              << "  --log-level <level>    trace | debug | info | warn | error\n"
              << "Commands:\n"
              << "  upload <file> [key]    Upload a file (key defaults to the file name)\n"
              << "  list                   List stored objects\n"
              << "  download <key> <dest>  Download an object\n";
}

int run_upload(mpu::client::RelayTransport& transport, const std::vector<std::string>& args, uint32_t retries) {
    if (args.empty()) {
        spdlog::error("upload needs a file");
        return 2;
    }
    const fs::path file = args[0];
    const std::string key = args.size() > 1 ? args[1] : file.filename().string();

    mpu::client::UploadOptions options;
    options.part_retries = retries;
    int last_percentage = -1;
    options.on_progress = [&last_percentage](const mpu::upload::UploadProgress& progress) {
        if (progress.percentage == last_percentage) {
            return;
        }
        last_percentage = progress.percentage;
        std::cout << "\r" << progress.loaded / (1024 * 1024) << "MB of " << progress.total / (1024 * 1024)
                  << "MB (" << progress.percentage << "%)" << std::flush;
    };

    mpu::client::UploadClient client(transport, options);
    auto report = client.upload(file, key);
    std::cout << "\n";
    if (report.is_error()) {
        std::cerr << report.error().message << "\n";
        return 1;
    }

    const auto& r = report.value();
    std::cout << r.message << " " << r.key << " (" << r.bytes << " bytes, "
              << mpu::upload::to_string(r.mode);
    if (r.mode == mpu::upload::UploadMode::Multipart) {
        std::cout << ", " << r.part_count << " parts";
    }
    std::cout << ", etag " << r.etag << ")\n";
    return 0;
}

int run_list(mpu::client::RelayTransport& transport) {
    mpu::client::UploadClient client(transport);
    auto objects = client.list_objects();
    if (objects.is_error()) {
        std::cerr << "Failed to list objects: " << objects.error().message << "\n";
        return 1;
    }
    for (const auto& info : objects.value()) {
        std::cout << mpu::util::format_timestamp(info.uploaded_at) << "  "
                  << info.size << "  " << info.key << "\n";
    }
    std::cout << objects.value().size() << " object(s)\n";
    return 0;
}

int run_download(mpu::client::RelayTransport& transport, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        spdlog::error("download needs a key and a destination");
        return 2;
    }

    auto sink = mpu::stream::FileSink::create(args[1]);
    if (sink.is_error()) {
        std::cerr << sink.error().message << "\n";
        return 1;
    }

    mpu::client::UploadClient client(transport);
    auto bytes = client.download(args[0], *sink.value());
    if (bytes.is_error()) {
        std::cerr << "Download failed: " << bytes.error().message << "\n";
        std::error_code ec;
        fs::remove(args[1], ec);
        return 1;
    }
    if (auto closed = sink.value()->close(); closed.is_error()) {
        std::cerr << "Download failed: " << closed.error().message << "\n";
        return 1;
    }
    std::cout << "Saved " << bytes.value() << " bytes to " << args[1] << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::warn);

    std::string relay_url = "http://127.0.0.1:8080";
    uint32_t retries = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--relay" && i + 1 < argc) {
            relay_url = argv[++i];
        } else if (arg == "--retries" && i + 1 < argc) {
            std::string value = argv[++i];
            auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), retries);
            if (ec != std::errc() || end != value.data() + value.size()) {
                std::cerr << "Invalid --retries value: " << value << "\n";
                return 2;
            }
        } else if (arg == "--log-level" && i + 1 < argc) {
            spdlog::set_level(spdlog::level::from_str(argv[++i]));
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    auto transport = mpu::client::HttpRelayTransport::connect(relay_url);
    if (transport.is_error()) {
        std::cerr << transport.error().message << "\n";
        return 2;
    }

    const std::string command = positional[0];
    const std::vector<std::string> rest(positional.begin() + 1, positional.end());

    if (command == "upload") {
        return run_upload(*transport.value(), rest, retries);
    }
    if (command == "list") {
        return run_list(*transport.value());
    }
    if (command == "download") {
        return run_download(*transport.value(), rest);
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 2;
}
