#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <drogon/drogon.h>
#include "core/bar_source.hpp"
#include "core/config.hpp"
#include "core/postgres_store.hpp"
#include "core/session_store.hpp"
#include "core/signal_provider.hpp"
#include "core/simulation_engine.hpp"
#include "core/stream_hub.hpp"
#include "control/control_server.hpp"
#include "exec/binance_gateway.hpp"
#include "feeds/binance_feed_adapter.hpp"
#include "ws/session_ws_controller.hpp"

namespace {

void setup_logging(const tradeflow::LoggingConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!cfg.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                cfg.file, cfg.max_file_size_mb * 1024 * 1024, cfg.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file {}: {}", cfg.file, e.what());
        }
    }
    auto logger = std::make_shared<spdlog::logger>("tradeflow", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(cfg.level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/settings.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    tradeflow::Config cfg;
    try {
        tradeflow::load_config(cfg, config_path);
    } catch (const std::exception& e) {
        spdlog::critical("Invalid config {}: {}", config_path, e.what());
        return 1;
    }
    setup_logging(cfg.logging);
    spdlog::info("TradeFlow starting. Control port={} bind={}",
                 cfg.services.control_port, cfg.services.bind_address);

    auto hub = std::make_shared<tradeflow::StreamHub>(
        tradeflow::binance_adapter_factory(cfg.feeds), cfg.hub);
    auto signals = std::make_shared<tradeflow::SignalBoard>();

    std::shared_ptr<tradeflow::SessionStore> store = tradeflow::PostgresStoreFactory::create(cfg.postgres);
    if (!store) {
        spdlog::info("Using in-memory session store");
        store = std::make_shared<tradeflow::MemorySessionStore>();
    }

    auto engine = std::make_shared<tradeflow::SimulationEngine>(
        hub, signals, store, cfg.simulation, cfg.hub.channel_capacity);
    engine->set_bar_source(std::make_shared<tradeflow::JsonlBarSource>(cfg.bars.directory));

    if (auto gateway = tradeflow::BinanceGateway::from_env(cfg.gateway)) {
        tradeflow::RetryPolicy retry;
        retry.max_retries = cfg.gateway.max_retries;
        retry.base = std::chrono::milliseconds(cfg.gateway.retry_base_ms);
        retry.cap = std::chrono::milliseconds(cfg.gateway.retry_cap_ms);
        engine->register_gateway("binance", gateway, retry);
    }

    size_t restored = engine->restore_from_store();
    if (restored > 0) {
        spdlog::info("Restored {} sessions", restored);
    }

    tradeflow::SessionWsController::init(engine, cfg.auth);
    auto api_ctrl = std::make_shared<tradeflow::ControlServer>(engine, hub, signals, cfg);

    drogon::app().addListener(cfg.services.bind_address, cfg.services.control_port);
    drogon::app().setThreadNum(cfg.services.io_threads);
    drogon::app().registerController(api_ctrl);
    drogon::app().registerController(std::make_shared<tradeflow::SessionWsController>());
    drogon::app().setTermSignalHandler([engine]() {
        spdlog::info("Shutdown requested");
        tradeflow::SessionWsController::shutdown();
        engine->shutdown();
        drogon::app().quit();
    });
    spdlog::info("Starting Drogon listener on {}:{}", cfg.services.bind_address, cfg.services.control_port);
    drogon::app().run();

    engine->shutdown();
    spdlog::info("TradeFlow stopped");
    return 0;
}
