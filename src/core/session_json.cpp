#include "session_json.hpp"
#include "errors.hpp"
#include <spdlog/fmt/fmt.h>

using json = nlohmann::json;

namespace tradeflow {

namespace {

json ts_json(Timestamp ts) {
    return utils::ts_to_iso(ts);
}

Timestamp ts_from(const json& j) {
    if (j.is_number_integer()) return utils::ms_to_ts(j.get<int64_t>());
    if (j.is_string()) {
        if (auto ts = utils::parse_ts_any(j.get<std::string>())) return *ts;
    }
    throw std::invalid_argument("invalid timestamp: " + j.dump());
}

json opt_decimal(const std::optional<Decimal>& d) {
    return d ? json(*d) : json(nullptr);
}

std::optional<Decimal> opt_decimal_from(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<Decimal>();
}

template <typename E>
E enum_from(const json& j, const char* key, std::optional<E> (*parse)(const std::string&), E fallback) {
    if (!j.contains(key) || j[key].is_null()) return fallback;
    auto s = j[key].get<std::string>();
    auto v = parse(s);
    if (!v) throw ValidationError(fmt::format("invalid {}: {}", key, s));
    return *v;
}

} // namespace

void to_json(json& j, const RiskConfig& r) {
    j = json{
        {"stop_loss_pct", opt_decimal(r.stop_loss_pct)},
        {"take_profit_pct", opt_decimal(r.take_profit_pct)},
        {"max_position_size_pct", r.max_position_size_pct}
    };
}

void from_json(const json& j, RiskConfig& r) {
    r.stop_loss_pct = opt_decimal_from(j, "stop_loss_pct");
    r.take_profit_pct = opt_decimal_from(j, "take_profit_pct");
    if (j.contains("max_position_size_pct") && !j["max_position_size_pct"].is_null()) {
        r.max_position_size_pct = j["max_position_size_pct"].get<Decimal>();
    }
}

void to_json(json& j, const SessionConfig& c) {
    j = json{
        {"name", c.name},
        {"strategy_ref", c.strategy_ref},
        {"symbol", c.symbol},
        {"timeframe", c.timeframe},
        {"mode", to_string(c.mode)},
        {"exchange", c.exchange},
        {"initial_capital", c.initial_capital},
        {"risk", c.risk},
        {"entry_fee_rate", c.fees.entry_rate},
        {"exit_fee_rate", c.fees.exit_rate},
        {"slippage_rate", c.slippage_rate},
        {"price_increment", c.instrument.price_increment},
        {"quantity_step", c.instrument.quantity_step},
        {"max_open_positions", c.max_open_positions},
        {"allow_short", c.allow_short},
        {"funding_policy", to_string(c.funding_policy)},
        {"equity_sample_interval_sec", c.equity_sample_interval_sec},
        {"bar_interval", c.bar_interval},
        {"start_time", c.start_time ? ts_json(*c.start_time) : json(nullptr)},
        {"end_time", c.end_time ? ts_json(*c.end_time) : json(nullptr)}
    };
}

void from_json(const json& j, SessionConfig& c) {
    c.name = j.value("name", c.name);
    c.strategy_ref = j.value("strategy_ref", c.strategy_ref);
    c.symbol = j.value("symbol", c.symbol);
    c.timeframe = j.value("timeframe", c.timeframe);
    c.mode = enum_from(j, "mode", parse_session_mode, c.mode);
    c.exchange = j.value("exchange", c.exchange);
    if (j.contains("initial_capital")) c.initial_capital = j["initial_capital"].get<Decimal>();
    if (j.contains("risk")) c.risk = j["risk"].get<RiskConfig>();
    if (j.contains("entry_fee_rate")) c.fees.entry_rate = j["entry_fee_rate"].get<Decimal>();
    if (j.contains("exit_fee_rate")) c.fees.exit_rate = j["exit_fee_rate"].get<Decimal>();
    if (j.contains("slippage_rate")) c.slippage_rate = j["slippage_rate"].get<Decimal>();
    if (j.contains("price_increment")) c.instrument.price_increment = j["price_increment"].get<Decimal>();
    if (j.contains("quantity_step")) c.instrument.quantity_step = j["quantity_step"].get<Decimal>();
    c.max_open_positions = j.value("max_open_positions", c.max_open_positions);
    c.allow_short = j.value("allow_short", c.allow_short);
    c.funding_policy = enum_from(j, "funding_policy", parse_funding_policy, c.funding_policy);
    c.equity_sample_interval_sec = j.value("equity_sample_interval_sec", c.equity_sample_interval_sec);
    c.bar_interval = j.value("bar_interval", c.bar_interval);
    if (j.contains("start_time") && !j["start_time"].is_null()) c.start_time = ts_from(j["start_time"]);
    if (j.contains("end_time") && !j["end_time"].is_null()) c.end_time = ts_from(j["end_time"]);
}

void to_json(json& j, const Position& p) {
    j = json{
        {"id", p.id},
        {"symbol", p.symbol},
        {"side", to_string(p.side)},
        {"entry_price", p.entry_price},
        {"quantity", p.quantity},
        {"entry_time", ts_json(p.entry_time)},
        {"notional_at_entry", p.notional_at_entry},
        {"entry_fee", p.entry_fee},
        {"stop_loss_price", opt_decimal(p.stop_loss_price)},
        {"take_profit_price", opt_decimal(p.take_profit_price)},
        {"funding_accrued", p.funding_accrued},
        {"last_mark_price", p.last_mark_price},
        {"unrealized_pnl", p.gross_pnl(p.last_mark_price) + p.funding_accrued}
    };
}

void from_json(const json& j, Position& p) {
    p.id = j.at("id").get<std::string>();
    p.symbol = j.value("symbol", std::string{});
    p.side = parse_position_side(j.at("side").get<std::string>()).value_or(PositionSide::LONG);
    p.entry_price = j.at("entry_price").get<Decimal>();
    p.quantity = j.at("quantity").get<Decimal>();
    p.entry_time = ts_from(j.at("entry_time"));
    p.notional_at_entry = j.at("notional_at_entry").get<Decimal>();
    p.entry_fee = j.at("entry_fee").get<Decimal>();
    p.stop_loss_price = opt_decimal_from(j, "stop_loss_price");
    p.take_profit_price = opt_decimal_from(j, "take_profit_price");
    if (j.contains("funding_accrued")) p.funding_accrued = j["funding_accrued"].get<Decimal>();
    if (j.contains("last_mark_price")) p.last_mark_price = j["last_mark_price"].get<Decimal>();
}

void to_json(json& j, const ClosedTrade& t) {
    j = json{
        {"position", t.position},
        {"exit_price", t.exit_price},
        {"exit_time", ts_json(t.exit_time)},
        {"exit_reason", to_string(t.exit_reason)},
        {"exit_fee", t.exit_fee},
        {"realized_pnl", t.realized_pnl},
        {"fees_paid", t.fees_paid},
        {"pnl_pct", t.pnl_pct}
    };
}

void from_json(const json& j, ClosedTrade& t) {
    t.position = j.at("position").get<Position>();
    t.exit_price = j.at("exit_price").get<Decimal>();
    t.exit_time = ts_from(j.at("exit_time"));
    t.exit_reason = parse_exit_reason(j.at("exit_reason").get<std::string>()).value_or(ExitReason::MANUAL);
    if (j.contains("exit_fee")) t.exit_fee = j["exit_fee"].get<Decimal>();
    t.realized_pnl = j.at("realized_pnl").get<Decimal>();
    t.fees_paid = j.at("fees_paid").get<Decimal>();
    t.pnl_pct = j.value("pnl_pct", 0.0);
}

void to_json(json& j, const EquityPoint& e) {
    j = json{{"timestamp", ts_json(e.timestamp)}, {"equity", e.equity}};
}

void from_json(const json& j, EquityPoint& e) {
    e.timestamp = ts_from(j.at("timestamp"));
    e.equity = j.at("equity").get<Decimal>();
}

void to_json(json& j, const BacktestReport& r) {
    j = json{
        {"total_trades", r.total_trades},
        {"winning_trades", r.winning_trades},
        {"losing_trades", r.losing_trades},
        {"win_rate", r.win_rate},
        {"total_pnl", r.total_pnl},
        {"total_fees", r.total_fees},
        {"avg_win", r.avg_win},
        {"avg_loss", r.avg_loss},
        {"largest_win", r.largest_win},
        {"largest_loss", r.largest_loss},
        {"profit_factor", r.profit_factor},
        {"total_return_pct", r.total_return_pct},
        {"max_drawdown_pct", r.max_drawdown_pct},
        {"sharpe_ratio", r.sharpe_ratio},
        {"volatility", r.volatility},
        {"final_capital", r.final_capital},
        {"peak_capital", r.peak_capital},
        {"lowest_capital", r.lowest_capital},
        {"exit_reasons", r.exit_reasons}
    };
}

void from_json(const json& j, BacktestReport& r) {
    r.total_trades = j.value("total_trades", 0);
    r.winning_trades = j.value("winning_trades", 0);
    r.losing_trades = j.value("losing_trades", 0);
    r.win_rate = j.value("win_rate", 0.0);
    r.total_pnl = j.value("total_pnl", Decimal{});
    r.total_fees = j.value("total_fees", Decimal{});
    r.avg_win = j.value("avg_win", Decimal{});
    r.avg_loss = j.value("avg_loss", Decimal{});
    r.largest_win = j.value("largest_win", Decimal{});
    r.largest_loss = j.value("largest_loss", Decimal{});
    r.profit_factor = j.value("profit_factor", 0.0);
    r.total_return_pct = j.value("total_return_pct", 0.0);
    r.max_drawdown_pct = j.value("max_drawdown_pct", 0.0);
    r.sharpe_ratio = j.value("sharpe_ratio", 0.0);
    r.volatility = j.value("volatility", 0.0);
    r.final_capital = j.value("final_capital", Decimal{});
    r.peak_capital = j.value("peak_capital", Decimal{});
    r.lowest_capital = j.value("lowest_capital", Decimal{});
    r.exit_reasons = j.value("exit_reasons", std::map<std::string, int>{});
}

void to_json(json& j, const SessionEvent& e) {
    j = json{
        {"session_id", e.session_id},
        {"type", to_string(e.type)},
        {"timestamp", ts_json(e.timestamp)},
        {"data", e.payload}
    };
}

json snapshot_to_record(const SessionSnapshot& s) {
    json j{
        {"id", s.id},
        {"config", s.config},
        {"status", to_string(s.status)},
        {"current_capital", s.current_capital},
        {"open_positions", s.open_positions},
        {"closed_trades", s.closed_trades},
        {"equity_curve", s.equity_curve},
        {"last_price", opt_decimal(s.last_price)},
        {"last_event_time", s.last_event_time ? ts_json(*s.last_event_time) : json(nullptr)},
        {"events_processed", s.events_processed},
        {"events_discarded", s.events_discarded},
        {"created_at", ts_json(s.created_at)},
        {"stopped_at", s.stopped_at ? ts_json(*s.stopped_at) : json(nullptr)},
        {"stop_reason", s.stop_reason},
        {"report", s.report ? json(*s.report) : json(nullptr)}
    };
    return j;
}

SessionSnapshot snapshot_from_record(const json& j) {
    SessionSnapshot s;
    s.id = j.at("id").get<std::string>();
    s.config = j.at("config").get<SessionConfig>();
    s.status = parse_session_status(j.at("status").get<std::string>()).value_or(SessionStatus::STOPPED);
    s.current_capital = j.at("current_capital").get<Decimal>();
    s.open_positions = j.value("open_positions", std::vector<Position>{});
    s.closed_trades = j.value("closed_trades", std::vector<ClosedTrade>{});
    s.equity_curve = j.value("equity_curve", std::vector<EquityPoint>{});
    s.last_price = opt_decimal_from(j, "last_price");
    if (j.contains("last_event_time") && !j["last_event_time"].is_null()) {
        s.last_event_time = ts_from(j["last_event_time"]);
    }
    s.events_processed = j.value("events_processed", uint64_t{0});
    s.events_discarded = j.value("events_discarded", uint64_t{0});
    if (j.contains("created_at")) s.created_at = ts_from(j["created_at"]);
    if (j.contains("stopped_at") && !j["stopped_at"].is_null()) s.stopped_at = ts_from(j["stopped_at"]);
    s.stop_reason = j.value("stop_reason", std::string{});
    if (j.contains("report") && !j["report"].is_null()) s.report = j["report"].get<BacktestReport>();
    return s;
}

json snapshot_summary(const SessionSnapshot& s) {
    Decimal realized;
    for (const auto& t : s.closed_trades) realized += t.realized_pnl;
    return json{
        {"id", s.id},
        {"name", s.config.name},
        {"symbol", s.config.symbol},
        {"mode", to_string(s.config.mode)},
        {"status", to_string(s.status)},
        {"initial_capital", s.config.initial_capital},
        {"current_capital", s.current_capital},
        {"realized_pnl", realized},
        {"open_positions", s.open_positions.size()},
        {"closed_trades", s.closed_trades.size()},
        {"events_processed", s.events_processed},
        {"events_discarded", s.events_discarded},
        {"created_at", ts_json(s.created_at)}
    };
}

SessionConfig session_config_from_request(const json& body, SessionConfig defaults) {
    SessionConfig c = std::move(defaults);
    try {
        from_json(body, c);
        if (body.contains("strategy_id")) c.strategy_ref = body["strategy_id"].dump();
        // Flat risk fields are accepted next to the nested "risk" object.
        if (body.contains("stop_loss_pct")) c.risk.stop_loss_pct = opt_decimal_from(body, "stop_loss_pct");
        if (body.contains("take_profit_pct")) c.risk.take_profit_pct = opt_decimal_from(body, "take_profit_pct");
        if (body.contains("max_position_size_pct")) {
            c.risk.max_position_size_pct = body["max_position_size_pct"].get<Decimal>();
        }
        if (body.contains("fee_rate")) {
            c.fees.entry_rate = body["fee_rate"].get<Decimal>();
            c.fees.exit_rate = c.fees.entry_rate;
        }
        if (body.contains("slippage")) c.slippage_rate = body["slippage"].get<Decimal>();
    } catch (const ValidationError&) {
        throw;
    } catch (const std::exception& e) {
        throw ValidationError(std::string("malformed session config: ") + e.what());
    }
    c.symbol = utils::to_upper(c.symbol);
    return c;
}

} // namespace tradeflow
