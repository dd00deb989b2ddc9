#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "execution_gateway.hpp"
#include "market_event.hpp"
#include "performance.hpp"
#include "session_types.hpp"
#include "signal_provider.hpp"
#include "trade_book.hpp"

namespace tradeflow {

struct LiveRouting {
    std::shared_ptr<ExecutionGateway> gateway;
    RetryPolicy retry;
    Sleeper sleep;
};

/**
 * Trading logic of one session, independent of threads and subscriptions.
 *
 * on_event() applies one market event in this order:
 *   1. entry, when fewer than max_open_positions are open and the signal is not neutral;
 *   2. exits for positions that were open before the event: stop-loss, then
 *      take-profit, then opposing signal, first match wins;
 *   3. equity sample when the event-time cadence has elapsed.
 * Identical configs fed identical event sequences produce identical books.
 */
class TradingSession {
public:
    TradingSession(std::string id,
                   SessionConfig cfg,
                   std::shared_ptr<SignalProvider> signals,
                   std::optional<LiveRouting> live = std::nullopt);

    // Throws InvariantViolation if the book breaks conservation.
    std::vector<SessionEvent> on_event(const MarketEvent& ev);

    // Close everything at the last known price (or the given fallback).
    std::vector<SessionEvent> close_all(ExitReason reason, Timestamp at);

    // Symbol, kind and price checks, plus a dry run that the book can absorb the price.
    bool accepts(const MarketEvent& ev) const;

    const TradeBook& book() const { return book_; }
    const PerformanceTracker& equity_curve() const { return equity_; }
    const SessionConfig& config() const { return cfg_; }
    std::optional<Decimal> last_price() const { return last_price_; }
    std::optional<Timestamp> last_event_time() const { return last_event_time_; }
    uint64_t discarded() const { return discarded_; }

    // Book, trade log, equity curve and market state; the caller adds status and counters.
    void fill_snapshot(SessionSnapshot& s) const;

    // Resume from a persisted record.
    void restore(const SessionSnapshot& s);

private:
    std::optional<PositionSide> side_for(Signal signal) const;
    // Simulated fill with slippage applied against the taker.
    Decimal simulated_fill(Side side, Decimal price) const;
    std::optional<ExitReason> exit_reason_for(const Position& pos, Decimal price, Signal signal) const;
    void try_enter(const MarketEvent& ev, Signal signal, std::vector<SessionEvent>& out);
    bool try_exit(const std::string& position_id, Decimal price, Timestamp ts, ExitReason reason,
                  std::vector<SessionEvent>& out);
    // Live mode: send the order and return the fill (price, quantity); nullopt on terminal failure.
    std::optional<std::pair<Decimal, Decimal>> route(Side side, Decimal quantity, Decimal price,
                                                     Timestamp ts, std::vector<SessionEvent>& out);
    void sample(Timestamp ts, std::vector<SessionEvent>& out);
    void maybe_sample(Timestamp ts, std::vector<SessionEvent>& out);
    SessionEvent make_event(SessionEventType type, Timestamp ts, nlohmann::json payload) const;
    SessionEvent alert(Timestamp ts, const std::string& level, const std::string& message) const;

    std::string id_;
    SessionConfig cfg_;
    std::shared_ptr<SignalProvider> signals_;
    std::optional<LiveRouting> live_;
    TradeBook book_;
    PerformanceTracker equity_;
    std::optional<Decimal> last_price_;
    std::optional<Timestamp> last_event_time_;
    uint64_t discarded_{0};
    uint64_t order_seq_{0};
};

} // namespace tradeflow
