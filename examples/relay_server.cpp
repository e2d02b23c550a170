/**
 * @file relay_server.cpp
 * @brief Multipart upload relay over a memory or disk object store
 *
 * Usage:
 *   mpu_relay_server --backend disk -d ./relay_data -p 8080
 *   mpu_relay_server --config relay.json --threads 4
 *
 * Ctrl+C stops the event loop and prints the upload counters.
 */

#include "mpu/config/relay_config.hpp"
#include "mpu/events/components.hpp"
#include "mpu/events/event_bus.hpp"
#include "mpu/events/events.hpp"
#include "mpu/network/http_router.hpp"
#include "mpu/network/http_server_asio.hpp"
#include "mpu/relay/relay_service.hpp"
#include "mpu/storage/disk_object_store.hpp"
#include "mpu/storage/memory_object_store.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            std::cout << mpu::config::usage(argv[0]);
            return 0;
        }
    }

    auto loaded = mpu::config::RelayConfig::from_args(argc, argv);
    if (loaded.is_error()) {
        spdlog::error("{}", loaded.error().message);
        std::cerr << mpu::config::usage(argv[0]);
        return 2;
    }
    const auto& config = loaded.value();
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    std::unique_ptr<mpu::storage::ObjectStoreAdapter> store;
    if (config.backend == mpu::config::BackendKind::Disk) {
        auto disk = std::make_unique<mpu::storage::DiskObjectStore>(config.store_config());
        auto ready = disk->initialize();
        if (ready.is_error()) {
            spdlog::error("Failed to open data directory {}: {}", config.data_root.string(), ready.error().message);
            return 1;
        }
        store = std::move(disk);
    } else {
        store = std::make_unique<mpu::storage::MemoryObjectStore>(config.store_config());
    }

    mpu::events::EventBus event_bus;
    mpu::events::LoggerComponent logger(event_bus);
    mpu::events::MetricsComponent metrics(event_bus);

    mpu::relay::RelayOptions options;
    options.chunk_size = config.chunk_size;
    options.public_url = config.public_url;
    options.limits = config.planner_limits();
    options.idle_timeout = std::chrono::seconds(config.idle_timeout);
    mpu::relay::RelayService relay(*store, event_bus, options);

    mpu::network::HttpRouter router;
    relay.register_routes(router);

    try {
        boost::asio::io_context io_context;

        mpu::network::HttpServerAsio server(io_context, config.bind_address, config.port,
                                            static_cast<size_t>(config.max_body_size()));
        server.set_handler([&router](const mpu::network::HttpRequest& request) {
            return router.handle_request(request);
        });

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            event_bus.emit(mpu::events::ServerShuttingDownEvent(signal_number == SIGINT ? "SIGINT" : "SIGTERM"));
            server.stop();
            io_context.stop();
        });

        event_bus.emit(mpu::events::ServerStartedEvent(server.get_port(), mpu::config::to_string(config.backend)));
        spdlog::info("Max request body {} bytes, chunk size {} bytes, {} thread(s)",
                     config.max_body_size(), config.chunk_size, config.threads);

        if (auto ran = mpu::network::run_event_loop(io_context, config.threads); ran.is_error()) {
            spdlog::error("{}", ran.error().message);
            metrics.print_stats();
            return 1;
        }
    } catch (const std::exception& e) {
        spdlog::error("Relay error: {}", e.what());
        return 1;
    }

    if (relay.active_uploads() > 0) {
        spdlog::warn("{} multipart upload(s) still open; clients can resume them after restart",
                     relay.active_uploads());
    }
    metrics.print_stats();
    return 0;
}
