#pragma once

#include <cstdint>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace tradeflow {

using json = nlohmann::json;

struct PostgresConfig {
    bool enabled{false};
    std::string host{"localhost"};
    uint16_t port{5432};
    std::string database{"tradeflow"};
    std::string user{"postgres"};
    std::string password{};
};

struct ServiceConfig {
    uint16_t control_port{8000};
    std::string bind_address{"127.0.0.1"};
    size_t io_threads{2};
};

struct HubConfig {
    size_t channel_capacity{256};
};

struct FeedConfig {
    std::string spot_ws_url{"wss://stream.binance.com:9443"};
    std::string futures_ws_url{"wss://fstream.binance.com"};
    int64_t reconnect_base_ms{1000};
    int64_t reconnect_cap_ms{30000};
    std::string kline_interval{"1m"};
};

struct SimulationConfig {
    int max_sessions{50};
    double entry_fee_rate{0.001};
    double exit_fee_rate{0.001};
    double slippage_rate{0.0};              // simulated fills only; live fills come from the venue
    double price_increment{0.01};
    double quantity_step{0.00000001};
    int64_t equity_sample_interval_sec{60};
    int max_open_positions{1};
    bool allow_short{true};
    std::string funding_policy{"ignore"};   // ignore | accrue
    std::string signal_timeframe{"1m"};
};

struct GatewayConfig {
    bool enabled{false};
    std::string rest_url{"https://api.binance.com"};
    int64_t recv_window_ms{5000};
    double request_timeout_sec{10.0};
    int max_retries{3};
    int64_t retry_base_ms{500};
    int64_t retry_cap_ms{8000};
    size_t requests_per_minute{1200};
};

struct BarSourceConfig {
    std::string directory{"data/bars"};
};

struct LoggingConfig {
    std::string level{"info"};
    std::string file{};
    size_t max_file_size_mb{50};
    size_t max_files{5};
};

struct AuthConfig {
    std::string token{};
};

struct Config {
    PostgresConfig postgres;
    ServiceConfig services;
    HubConfig hub;
    FeedConfig feeds;
    SimulationConfig simulation;
    GatewayConfig gateway;
    BarSourceConfig bars;
    LoggingConfig logging;
    AuthConfig auth;
};

inline void load_config(Config& cfg, const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("Config file {} not found, using defaults", path);
        return;
    }
    json j = json::parse(f, nullptr, true, true);
    if (j.contains("postgres")) {
        auto& pg = j["postgres"];
        cfg.postgres.enabled = pg.value("enabled", cfg.postgres.enabled);
        cfg.postgres.host = pg.value("host", cfg.postgres.host);
        cfg.postgres.port = pg.value("port", cfg.postgres.port);
        cfg.postgres.database = pg.value("database", cfg.postgres.database);
        cfg.postgres.user = pg.value("user", cfg.postgres.user);
        cfg.postgres.password = pg.value("password", cfg.postgres.password);
    }
    if (j.contains("services")) {
        auto& svc = j["services"];
        cfg.services.control_port = svc.value("control_port", cfg.services.control_port);
        cfg.services.bind_address = svc.value("bind_address", cfg.services.bind_address);
        cfg.services.io_threads = svc.value("io_threads", cfg.services.io_threads);
    }
    if (j.contains("hub")) {
        auto& h = j["hub"];
        cfg.hub.channel_capacity = h.value("channel_capacity", cfg.hub.channel_capacity);
    }
    if (j.contains("feeds")) {
        auto& fd = j["feeds"];
        cfg.feeds.spot_ws_url = fd.value("spot_ws_url", cfg.feeds.spot_ws_url);
        cfg.feeds.futures_ws_url = fd.value("futures_ws_url", cfg.feeds.futures_ws_url);
        cfg.feeds.reconnect_base_ms = fd.value("reconnect_base_ms", cfg.feeds.reconnect_base_ms);
        cfg.feeds.reconnect_cap_ms = fd.value("reconnect_cap_ms", cfg.feeds.reconnect_cap_ms);
        cfg.feeds.kline_interval = fd.value("kline_interval", cfg.feeds.kline_interval);
    }
    if (j.contains("simulation")) {
        auto& s = j["simulation"];
        cfg.simulation.max_sessions = s.value("max_sessions", cfg.simulation.max_sessions);
        cfg.simulation.entry_fee_rate = s.value("entry_fee_rate", cfg.simulation.entry_fee_rate);
        cfg.simulation.exit_fee_rate = s.value("exit_fee_rate", cfg.simulation.exit_fee_rate);
        // Single "fee_rate" applies to both legs.
        if (s.contains("fee_rate")) {
            cfg.simulation.entry_fee_rate = s["fee_rate"].get<double>();
            cfg.simulation.exit_fee_rate = cfg.simulation.entry_fee_rate;
        }
        cfg.simulation.slippage_rate = s.value("slippage_rate", cfg.simulation.slippage_rate);
        cfg.simulation.price_increment = s.value("price_increment", cfg.simulation.price_increment);
        cfg.simulation.quantity_step = s.value("quantity_step", cfg.simulation.quantity_step);
        cfg.simulation.equity_sample_interval_sec = s.value("equity_sample_interval_sec",
                                                            cfg.simulation.equity_sample_interval_sec);
        cfg.simulation.max_open_positions = s.value("max_open_positions", cfg.simulation.max_open_positions);
        cfg.simulation.allow_short = s.value("allow_short", cfg.simulation.allow_short);
        cfg.simulation.funding_policy = s.value("funding_policy", cfg.simulation.funding_policy);
        cfg.simulation.signal_timeframe = s.value("signal_timeframe", cfg.simulation.signal_timeframe);
    }
    if (j.contains("gateway")) {
        auto& g = j["gateway"];
        cfg.gateway.enabled = g.value("enabled", cfg.gateway.enabled);
        cfg.gateway.rest_url = g.value("rest_url", cfg.gateway.rest_url);
        cfg.gateway.recv_window_ms = g.value("recv_window_ms", cfg.gateway.recv_window_ms);
        cfg.gateway.request_timeout_sec = g.value("request_timeout_sec", cfg.gateway.request_timeout_sec);
        cfg.gateway.max_retries = g.value("max_retries", cfg.gateway.max_retries);
        cfg.gateway.retry_base_ms = g.value("retry_base_ms", cfg.gateway.retry_base_ms);
        cfg.gateway.retry_cap_ms = g.value("retry_cap_ms", cfg.gateway.retry_cap_ms);
        cfg.gateway.requests_per_minute = g.value("requests_per_minute", cfg.gateway.requests_per_minute);
    }
    if (j.contains("bars")) {
        cfg.bars.directory = j["bars"].value("directory", cfg.bars.directory);
    }
    if (j.contains("logging")) {
        auto& l = j["logging"];
        cfg.logging.level = l.value("level", cfg.logging.level);
        cfg.logging.file = l.value("file", cfg.logging.file);
        cfg.logging.max_file_size_mb = l.value("max_file_size_mb", cfg.logging.max_file_size_mb);
        cfg.logging.max_files = l.value("max_files", cfg.logging.max_files);
    }
    if (j.contains("auth")) {
        cfg.auth.token = j["auth"].value("token", cfg.auth.token);
    }
}

} // namespace tradeflow
