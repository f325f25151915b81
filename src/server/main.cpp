/**
 * @file main.cpp
 * @brief chunkd_server: resumable chunked upload/download over HTTP
 *
 * Startup order:
 * 1. Configuration (defaults, --config file, flags) and logging
 * 2. Event bus with logger and metrics components
 * 3. Disk I/O worker pool and transfer service
 * 4. Routes and HTTP server
 *
 * SIGINT/SIGTERM stop the accept loop; queued requests finish, then the
 * worker pool is drained and the session statistics are printed.
 */

#include "chunkd/api/routes.hpp"
#include "chunkd/core/config.hpp"
#include "chunkd/events/components.hpp"
#include "chunkd/events/event_bus.hpp"
#include "chunkd/events/events.hpp"
#include "chunkd/network/http_router.hpp"
#include "chunkd/network/http_server.hpp"
#include "chunkd/storage/worker_pool.hpp"
#include "chunkd/transfer/service.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <memory>

using namespace chunkd;

namespace {

network::HttpServer* g_server = nullptr;

void signal_handler(int) {
    if (g_server) {
        g_server->stop();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    ServerConfig config;
    bool show_help = false;
    auto parsed = apply_command_line(argc, argv, config, show_help);
    if (parsed.is_error()) {
        spdlog::error("{}", parsed.error());
        std::cerr << usage(argv[0]);
        return 2;
    }
    if (show_help) {
        std::cout << usage(argv[0]);
        return 0;
    }
    if (auto valid = config.validate(); valid.is_error()) {
        spdlog::error("Invalid configuration: {}", valid.error());
        return 2;
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));

    // ════════════════════════════════════════════════════════════
    // Event-driven components
    // ════════════════════════════════════════════════════════════

    events::EventBus event_bus;
    events::LoggerComponent logger(event_bus);
    events::MetricsComponent metrics(event_bus);

    // ════════════════════════════════════════════════════════════
    // Transfer core
    // ════════════════════════════════════════════════════════════

    std::unique_ptr<storage::WorkerPool> pool;
    if (config.transfer.offload_io) {
        pool = std::make_unique<storage::WorkerPool>(config.transfer.worker_pool_size);
        spdlog::info("Disk I/O offloaded to {} worker threads", pool->size());
    }

    transfer::TransferService service(config.transfer, event_bus, pool.get());
    spdlog::info("Chunk size {} bytes, max file size {} bytes, max {} parts, {} part order",
                 config.transfer.chunk_size, config.transfer.max_file_size, config.transfer.max_parts,
                 config.transfer.strict_part_order ? "strict" : "lenient");

    // ════════════════════════════════════════════════════════════
    // HTTP
    // ════════════════════════════════════════════════════════════

    network::HttpRouter router;
    api::register_routes(router, service);
    for (const auto& route : router.list_routes()) {
        spdlog::debug("  {}", route);
    }

    network::HttpServer server(config.http_threads, config.max_pending_connections);
    server.set_receive_timeout(config.io_timeout_seconds);
    server.set_max_body_size(config.max_request_body());
    server.set_handler([&router](const network::HttpRequest& request) {
        return router.handle_request(request);
    });

    auto listen_result = server.listen(config.port, config.host);
    if (listen_result.is_error()) {
        spdlog::error("Failed to start server: {}", listen_result.error());
        return 1;
    }

    g_server = &server;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    event_bus.emit(events::ServerStartedEvent{server.get_port(), config.transfer.upload_directory.string()});

    auto serve_result = server.serve_forever();
    g_server = nullptr;

    event_bus.emit(events::ServerShuttingDownEvent{"signal"});

    if (pool) {
        pool->shutdown();
    }
    metrics.print_stats();

    if (serve_result.is_error()) {
        spdlog::error("Server error: {}", serve_result.error());
        return 1;
    }

    spdlog::info("Server shut down cleanly");
    return 0;
}
