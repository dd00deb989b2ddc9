#include "trading_session.hpp"
#include "errors.hpp"
#include "session_json.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

using json = nlohmann::json;

namespace tradeflow {

TradingSession::TradingSession(std::string id,
                               SessionConfig cfg,
                               std::shared_ptr<SignalProvider> signals,
                               std::optional<LiveRouting> live)
    : id_(std::move(id))
    , cfg_(std::move(cfg))
    , signals_(std::move(signals))
    , live_(std::move(live))
    , book_(cfg_.initial_capital, cfg_.fees, cfg_.instrument) {}

bool TradingSession::accepts(const MarketEvent& ev) const {
    if (ev.symbol != cfg_.symbol) return false;
    if (!ev.price.is_positive()) return false;
    if (ev.kind == EventKind::LIQUIDATION) return false;
    if (ev.kind == EventKind::FUNDING_RATE && !ev.funding_rate) return false;
    std::optional<Decimal> funding = ev.kind == EventKind::FUNDING_RATE ? ev.funding_rate : std::nullopt;
    if (!book_.in_range(ev.price, funding)) return false;
    try {
        // Slipped buy fills sit above the event price.
        if (!book_.in_range(simulated_fill(Side::BUY, ev.price))) return false;
    } catch (const std::overflow_error&) {
        return false;
    }
    return true;
}

std::vector<SessionEvent> TradingSession::on_event(const MarketEvent& ev) {
    std::vector<SessionEvent> out;
    if (!accepts(ev)) {
        ++discarded_;
        spdlog::debug("Session {}: discarded {} event for {} price={}",
                      id_, to_string(ev.kind), ev.symbol, ev.price.to_string());
        return out;
    }

    if (equity_.points().empty()) {
        equity_.record(ev.timestamp, book_.equity_at_last_mark());
    }
    last_event_time_ = ev.timestamp;

    if (ev.kind == EventKind::FUNDING_RATE) {
        if (cfg_.funding_policy == FundingPolicy::ACCRUE && !book_.positions().empty()) {
            book_.accrue_funding(*ev.funding_rate, ev.price);
        }
        maybe_sample(ev.timestamp, out);
        book_.check_invariant();
        return out;
    }

    last_price_ = ev.price;
    book_.mark(ev.price);

    Signal signal = signals_ ? signals_->get_signal(cfg_.symbol, cfg_.timeframe) : Signal::NEUTRAL;

    std::vector<std::string> held;
    held.reserve(book_.positions().size());
    for (const auto& p : book_.positions()) held.push_back(p.id);

    if (static_cast<int>(held.size()) < cfg_.max_open_positions && signal != Signal::NEUTRAL) {
        try_enter(ev, signal, out);
    }

    for (const auto& pid : held) {
        const Position* pos = nullptr;
        for (const auto& p : book_.positions()) {
            if (p.id == pid) { pos = &p; break; }
        }
        if (!pos) continue;
        if (auto reason = exit_reason_for(*pos, ev.price, signal)) {
            try_exit(pid, ev.price, ev.timestamp, *reason, out);
        }
    }

    maybe_sample(ev.timestamp, out);
    book_.check_invariant();
    return out;
}

std::optional<PositionSide> TradingSession::side_for(Signal signal) const {
    if (signal == Signal::BUY) return PositionSide::LONG;
    if (signal == Signal::SELL && cfg_.allow_short) return PositionSide::SHORT;
    return std::nullopt;
}

Decimal TradingSession::simulated_fill(Side side, Decimal price) const {
    if (live_ || cfg_.slippage_rate.is_zero()) return price;
    const Decimal one = Decimal::from_int(1);
    Decimal factor = side == Side::BUY ? one + cfg_.slippage_rate : one - cfg_.slippage_rate;
    return (price * factor).round_to(cfg_.instrument.price_increment);
}

std::optional<ExitReason> TradingSession::exit_reason_for(const Position& pos, Decimal price, Signal signal) const {
    bool is_long = pos.side == PositionSide::LONG;
    if (pos.stop_loss_price) {
        if (is_long ? price <= *pos.stop_loss_price : price >= *pos.stop_loss_price) {
            return ExitReason::STOP_LOSS;
        }
    }
    if (pos.take_profit_price) {
        if (is_long ? price >= *pos.take_profit_price : price <= *pos.take_profit_price) {
            return ExitReason::TAKE_PROFIT;
        }
    }
    if ((is_long && signal == Signal::SELL) || (!is_long && signal == Signal::BUY)) {
        return ExitReason::SIGNAL;
    }
    return std::nullopt;
}

void TradingSession::try_enter(const MarketEvent& ev, Signal signal, std::vector<SessionEvent>& out) {
    auto side = side_for(signal);
    if (!side) return;
    Side order_side = *side == PositionSide::LONG ? Side::BUY : Side::SELL;
    Decimal fill_price = simulated_fill(order_side, ev.price);
    auto plan = book_.plan_entry(fill_price, cfg_.risk.max_position_size_pct);
    if (!plan) {
        out.push_back(alert(ev.timestamp, "warning",
                            fmt::format("{} signal ignored: no capital available at {}",
                                        to_string(signal), ev.price.to_string())));
        return;
    }
    if (live_) {
        auto fill = route(order_side, plan->quantity, ev.price, ev.timestamp, out);
        if (!fill) return;
        fill_price = fill->first;
        plan->quantity = fill->second;
        plan->notional = plan->quantity * fill_price;
        plan->fee = book_.fee_for(plan->notional, cfg_.fees.entry_rate);
    }
    const Position& pos = book_.open(cfg_.symbol, *side, fill_price, *plan, ev.timestamp, cfg_.risk);
    spdlog::info("Session {}: opened {} {} qty={} @ {} (capital={})",
                 id_, to_string(pos.side), cfg_.symbol, pos.quantity.to_string(),
                 pos.entry_price.to_string(), book_.current_capital().to_string());
    out.push_back(make_event(SessionEventType::POSITION_OPENED, ev.timestamp, json(pos)));
}

bool TradingSession::try_exit(const std::string& position_id, Decimal price, Timestamp ts, ExitReason reason,
                              std::vector<SessionEvent>& out) {
    const Position* pos = nullptr;
    for (const auto& p : book_.positions()) {
        if (p.id == position_id) { pos = &p; break; }
    }
    if (!pos) return false;
    Side order_side = pos->side == PositionSide::LONG ? Side::SELL : Side::BUY;
    Decimal exit_price = simulated_fill(order_side, price);
    if (live_) {
        auto fill = route(order_side, pos->quantity, price, ts, out);
        // Position stays open; the exit is re-evaluated on the next event.
        if (!fill) return false;
        exit_price = fill->first;
    }
    ClosedTrade trade = book_.close(position_id, exit_price, ts, reason);
    spdlog::info("Session {}: closed {} {} @ {} reason={} pnl={} (capital={})",
                 id_, to_string(trade.position.side), cfg_.symbol, exit_price.to_string(),
                 to_string(reason), trade.realized_pnl.to_string(), book_.current_capital().to_string());
    out.push_back(make_event(SessionEventType::POSITION_CLOSED, ts, json(trade)));
    sample(ts, out);
    return true;
}

std::optional<std::pair<Decimal, Decimal>> TradingSession::route(Side side, Decimal quantity, Decimal price,
                                                                 Timestamp ts, std::vector<SessionEvent>& out) {
    OrderRequest req;
    req.symbol = cfg_.symbol;
    req.side = side;
    req.quantity = quantity;
    req.type = OrderType::MARKET;
    req.client_order_id = fmt::format("tf-{}-{}", id_.substr(0, 8), ++order_seq_);

    auto result = place_with_retry(*live_->gateway, req, live_->retry, live_->sleep);
    if (auto* err = std::get_if<ExecutionError>(&result)) {
        spdlog::error("Session {}: {} order for {} {} failed: {}",
                      id_, to_string(side), quantity.to_string(), cfg_.symbol, describe(*err));
        out.push_back(alert(ts, "error", fmt::format("{} order failed: {}", to_string(side), describe(*err))));
        return std::nullopt;
    }
    const auto& ack = std::get<OrderAck>(result);
    Decimal qty = ack.executed_qty.is_positive() ? ack.executed_qty : quantity;
    Decimal fill_price = ack.avg_price && ack.avg_price->is_positive() ? *ack.avg_price : price;
    out.push_back(alert(ts, "info", fmt::format("order {} filled: {} {} @ {}",
                                                ack.order_id, to_string(side), qty.to_string(),
                                                fill_price.to_string())));
    return std::make_pair(fill_price, qty);
}

std::vector<SessionEvent> TradingSession::close_all(ExitReason reason, Timestamp at) {
    std::vector<SessionEvent> out;
    if (book_.positions().empty()) return out;
    if (!last_price_) {
        // Nothing was ever priced; positions cannot exist without a price.
        throw InvariantViolation("open positions without a last known price");
    }
    Timestamp ts = last_event_time_.value_or(at);
    std::vector<std::string> ids;
    for (const auto& p : book_.positions()) ids.push_back(p.id);
    for (const auto& pid : ids) {
        try_exit(pid, *last_price_, ts, reason, out);
    }
    book_.check_invariant();
    return out;
}

void TradingSession::sample(Timestamp ts, std::vector<SessionEvent>& out) {
    Decimal eq = last_price_ ? book_.equity(*last_price_) : book_.equity_at_last_mark();
    equity_.record(ts, eq);
    out.push_back(make_event(SessionEventType::EQUITY_SAMPLE, ts,
                             json{{"equity", eq}, {"current_capital", book_.current_capital()}}));
}

void TradingSession::maybe_sample(Timestamp ts, std::vector<SessionEvent>& out) {
    auto last = equity_.last_timestamp();
    if (!last || ts - *last >= std::chrono::seconds(cfg_.equity_sample_interval_sec)) {
        sample(ts, out);
    }
}

SessionEvent TradingSession::make_event(SessionEventType type, Timestamp ts, json payload) const {
    SessionEvent ev;
    ev.session_id = id_;
    ev.type = type;
    ev.timestamp = ts;
    ev.payload = std::move(payload);
    return ev;
}

SessionEvent TradingSession::alert(Timestamp ts, const std::string& level, const std::string& message) const {
    return make_event(SessionEventType::ALERT, ts, json{{"level", level}, {"message", message}});
}

void TradingSession::fill_snapshot(SessionSnapshot& s) const {
    s.current_capital = book_.current_capital();
    s.open_positions = book_.positions();
    s.closed_trades = book_.closed_trades();
    s.equity_curve = equity_.points();
    s.last_price = last_price_;
    s.last_event_time = last_event_time_;
    s.events_discarded = discarded_;
}

void TradingSession::restore(const SessionSnapshot& s) {
    book_.restore(s.current_capital, s.open_positions, s.closed_trades);
    for (const auto& p : s.equity_curve) equity_.record(p.timestamp, p.equity);
    last_price_ = s.last_price;
    last_event_time_ = s.last_event_time;
    discarded_ = s.events_discarded;
    book_.check_invariant();
}

} // namespace tradeflow
