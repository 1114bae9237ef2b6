/**
 * @file main.cpp
 * @brief fmp_server entry point
 *
 * Run with:
 *   ./build/fmp_server -p 8080 -d ./portal_data -m local
 *   FMP_STORAGE_MODE=remote FMP_S3_ENDPOINT=memory:// ./build/fmp_server
 *
 * Try:
 *   curl -X POST localhost:8080/api/uploads -H 'X-Owner-Id: alice' \
 *        -d '{"filename":"a.bin","total_size":11}'
 *   curl -X PUT localhost:8080/api/uploads/<id>/chunks/0 -H 'X-Owner-Id: alice' --data-binary 'hello world'
 *   curl localhost:8080/api/files -H 'X-Owner-Id: alice'
 */

#include "fmp/config/config.hpp"
#include "fmp/events/components.hpp"
#include "fmp/events/event_bus.hpp"
#include "fmp/events/events.hpp"
#include "fmp/files/file_catalog.hpp"
#include "fmp/files/file_service.hpp"
#include "fmp/network/http_router.hpp"
#include "fmp/network/http_server.hpp"
#include "fmp/server/portal_api.hpp"
#include "fmp/storage/backend_factory.hpp"
#include "fmp/upload/dedup_index.hpp"
#include "fmp/upload/engine.hpp"
#include "fmp/upload/expiry_reaper.hpp"
#include "fmp/upload/session_ledger.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <filesystem>
#include <memory>

using namespace fmp;

namespace {

// Set once the server is up; the signal handler only stops its io_context
network::HttpServer* g_server = nullptr;

void signal_handler(int signal) {
    if ((signal == SIGINT || signal == SIGTERM) && g_server) {
        g_server->context().stop();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto loaded = config::load_config(argc, argv);
    if (loaded.is_error()) {
        spdlog::error("[Main] {}", loaded.error().message);
        return 1;
    }
    const config::PortalConfig config = loaded.value();
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::info("[Main] configuration: {}", config::to_json(config).dump());

    std::error_code ec;
    std::filesystem::create_directories(config.data_dir, ec);
    if (ec) {
        spdlog::error("[Main] cannot create data directory {}: {}", config.data_dir.string(), ec.message());
        return 1;
    }

    // ════════════════════════════════════════════════════════
    // Components
    // ════════════════════════════════════════════════════════

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    auto clock = std::make_shared<SystemClock>();

    auto backend = storage::make_backend(config, clock);
    if (backend.is_error()) {
        spdlog::error("[Main] storage backend unavailable: {}", backend.error().message);
        return 1;
    }

    upload::JsonFileSessionLedger ledger(config.data_dir / "sessions");

    auto dedup = config.persist_dedup_index
                     ? std::make_unique<upload::DedupIndex>(config.data_dir / "dedup_index.json")
                     : std::make_unique<upload::DedupIndex>();
    if (auto res = dedup->load(); res.is_error()) {
        spdlog::error("[Main] {}", res.error().message);
        return 1;
    }

    files::FileCatalog catalog(config.data_dir / "files.json");
    if (auto res = catalog.load(); res.is_error()) {
        spdlog::error("[Main] {}", res.error().message);
        return 1;
    }
    files::FileService file_service(catalog, *backend.value(), bus, clock, config.page_size);

    upload::EngineOptions engine_options;
    engine_options.session_ttl = config.session_ttl;
    engine_options.terminal_retention = config.terminal_retention;
    engine_options.max_file_size = config.max_file_size;
    engine_options.default_chunk_size = config.default_chunk_size;
    engine_options.max_chunks = config.max_chunks;
    upload::UploadEngine engine(*backend.value(), ledger, *dedup, bus, clock, engine_options);

    auto recovered = engine.recover();
    if (recovered.is_error()) {
        spdlog::error("[Main] session ledger unreadable: {}", recovered.error().message);
        return 1;
    }

    // A crash between ledger completion and record creation leaves an orphan session
    for (const auto& completed : engine.completed_uploads()) {
        if (auto res = file_service.record_completed_upload(completed); res.is_error()) {
            spdlog::warn("[Main] session={} record replay failed: {}", completed.session_id, res.error().message);
        }
    }

    upload::ExpiryReaper reaper(engine, std::chrono::duration_cast<std::chrono::milliseconds>(config.reaper_interval));
    reaper.sweep();
    reaper.start();

    // ════════════════════════════════════════════════════════
    // HTTP
    // ════════════════════════════════════════════════════════

    network::HttpRouter router;
    server::PortalApi api(engine, file_service, metrics, config);
    api.register_routes(router);

    network::HttpServerOptions server_options;
    server_options.port = config.port;
    server_options.threads = config.threads;
    server_options.max_body_bytes = config.max_file_size + 64 * 1024;

    network::HttpServer server(server_options, [&router](const network::HttpRequest& request) {
        return router.handle_request(request);
    });
    if (auto res = server.start(); res.is_error()) {
        spdlog::error("[Main] {}", res.error().message);
        return 1;
    }

    g_server = &server;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    bus.emit(events::ServerStartedEvent{server.port(), engine.mode()});
    for (const auto& route : router.list_routes()) {
        spdlog::debug("[Main] route {}", route);
    }

    server.wait();

    g_server = nullptr;
    bus.emit(events::ServerShuttingDownEvent{"signal"});
    server.stop();
    reaper.stop();
    return 0;
}
