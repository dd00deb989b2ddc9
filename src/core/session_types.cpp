#include "session_types.hpp"
#include "errors.hpp"
#include <spdlog/fmt/fmt.h>

namespace tradeflow {

const char* to_string(SessionStatus s) {
    switch (s) {
        case SessionStatus::CREATED: return "created";
        case SessionStatus::ACTIVE: return "active";
        case SessionStatus::PAUSED: return "paused";
        case SessionStatus::STOPPED: return "stopped";
    }
    return "unknown";
}

const char* to_string(SessionMode m) {
    switch (m) {
        case SessionMode::PAPER: return "paper";
        case SessionMode::BACKTEST: return "backtest";
        case SessionMode::LIVE: return "live";
    }
    return "unknown";
}

const char* to_string(PositionSide s) {
    return s == PositionSide::LONG ? "long" : "short";
}

const char* to_string(ExitReason r) {
    switch (r) {
        case ExitReason::SIGNAL: return "signal";
        case ExitReason::STOP_LOSS: return "stop_loss";
        case ExitReason::TAKE_PROFIT: return "take_profit";
        case ExitReason::MANUAL: return "manual";
        case ExitReason::END_OF_DATA: return "end_of_data";
    }
    return "unknown";
}

const char* to_string(FundingPolicy p) {
    return p == FundingPolicy::ACCRUE ? "accrue" : "ignore";
}

const char* to_string(SessionEventType t) {
    switch (t) {
        case SessionEventType::POSITION_OPENED: return "position_opened";
        case SessionEventType::POSITION_CLOSED: return "position_closed";
        case SessionEventType::ALERT: return "alert";
        case SessionEventType::EQUITY_SAMPLE: return "equity_sample";
        case SessionEventType::STATUS_CHANGED: return "status_changed";
    }
    return "unknown";
}

std::optional<SessionStatus> parse_session_status(const std::string& s) {
    if (s == "created") return SessionStatus::CREATED;
    if (s == "active") return SessionStatus::ACTIVE;
    if (s == "paused") return SessionStatus::PAUSED;
    if (s == "stopped") return SessionStatus::STOPPED;
    return std::nullopt;
}

std::optional<SessionMode> parse_session_mode(const std::string& s) {
    if (s == "paper") return SessionMode::PAPER;
    if (s == "backtest") return SessionMode::BACKTEST;
    if (s == "live") return SessionMode::LIVE;
    return std::nullopt;
}

std::optional<PositionSide> parse_position_side(const std::string& s) {
    if (s == "long") return PositionSide::LONG;
    if (s == "short") return PositionSide::SHORT;
    return std::nullopt;
}

std::optional<ExitReason> parse_exit_reason(const std::string& s) {
    if (s == "signal") return ExitReason::SIGNAL;
    if (s == "stop_loss") return ExitReason::STOP_LOSS;
    if (s == "take_profit") return ExitReason::TAKE_PROFIT;
    if (s == "manual") return ExitReason::MANUAL;
    if (s == "end_of_data") return ExitReason::END_OF_DATA;
    return std::nullopt;
}

std::optional<FundingPolicy> parse_funding_policy(const std::string& s) {
    if (s == "ignore") return FundingPolicy::IGNORE;
    if (s == "accrue") return FundingPolicy::ACCRUE;
    return std::nullopt;
}

SessionConfig default_session_config(const SimulationConfig& sim) {
    SessionConfig cfg;
    cfg.timeframe = sim.signal_timeframe;
    cfg.fees.entry_rate = Decimal::from_double(sim.entry_fee_rate);
    cfg.fees.exit_rate = Decimal::from_double(sim.exit_fee_rate);
    cfg.slippage_rate = Decimal::from_double(sim.slippage_rate);
    cfg.instrument.price_increment = Decimal::from_double(sim.price_increment);
    cfg.instrument.quantity_step = Decimal::from_double(sim.quantity_step);
    cfg.max_open_positions = sim.max_open_positions;
    cfg.allow_short = sim.allow_short;
    cfg.funding_policy = parse_funding_policy(sim.funding_policy).value_or(FundingPolicy::IGNORE);
    cfg.equity_sample_interval_sec = sim.equity_sample_interval_sec;
    return cfg;
}

namespace {

void check_pct(const char* name, Decimal v) {
    if (!v.is_positive() || v > Decimal::from_int(100)) {
        throw ValidationError(fmt::format("{} must be in (0, 100], got {}", name, v.to_string()));
    }
}

void check_rate(const char* name, Decimal v) {
    if (v.is_negative() || v >= Decimal::from_int(1)) {
        throw ValidationError(fmt::format("{} must be in [0, 1), got {}", name, v.to_string()));
    }
}

} // namespace

void validate(const SessionConfig& cfg) {
    if (cfg.symbol.empty()) throw ValidationError("symbol is required");
    if (!cfg.initial_capital.is_positive()) {
        throw ValidationError(fmt::format("initial_capital must be > 0, got {}", cfg.initial_capital.to_string()));
    }
    if (cfg.risk.stop_loss_pct) check_pct("stop_loss_pct", *cfg.risk.stop_loss_pct);
    if (cfg.risk.take_profit_pct) check_pct("take_profit_pct", *cfg.risk.take_profit_pct);
    check_pct("max_position_size_pct", cfg.risk.max_position_size_pct);
    check_rate("entry_fee_rate", cfg.fees.entry_rate);
    check_rate("exit_fee_rate", cfg.fees.exit_rate);
    if (cfg.slippage_rate.is_negative() || cfg.slippage_rate > Decimal::from_raw(Decimal::SCALE / 10)) {
        throw ValidationError(fmt::format("slippage_rate must be in [0, 0.1], got {}", cfg.slippage_rate.to_string()));
    }
    if (!cfg.instrument.price_increment.is_positive()) throw ValidationError("price_increment must be > 0");
    if (!cfg.instrument.quantity_step.is_positive()) throw ValidationError("quantity_step must be > 0");
    if (cfg.max_open_positions < 1) throw ValidationError("max_open_positions must be >= 1");
    if (cfg.equity_sample_interval_sec <= 0) throw ValidationError("equity_sample_interval_sec must be > 0");
    if (cfg.mode == SessionMode::BACKTEST && cfg.start_time && cfg.end_time && *cfg.start_time >= *cfg.end_time) {
        throw ValidationError("start_time must be before end_time");
    }
}

} // namespace tradeflow
