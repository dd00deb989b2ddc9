#pragma once

#include <optional>
#include <string>
#include <vector>
#include "session_types.hpp"

namespace tradeflow {

struct EntryPlan {
    Decimal quantity;
    Decimal notional;
    Decimal fee;
};

/**
 * Capital, open positions and the closed-trade log of one session.
 *
 * Cash bookkeeping keeps
 *   cash + sum(position.allocated()) == initial + sum(closed.realized_pnl)
 * exact after every operation, where allocated = notional at entry + entry fee.
 * Not thread-safe: a book belongs to exactly one session worker.
 */
class TradeBook {
public:
    TradeBook(Decimal initial_capital, FeeSchedule fees, InstrumentSpec instrument);

    // Sizing for a new position at price; nullopt when nothing can be bought.
    std::optional<EntryPlan> plan_entry(Decimal price, Decimal max_position_pct) const;

    const Position& open(const std::string& symbol, PositionSide side, Decimal price,
                         const EntryPlan& plan, Timestamp ts, const RiskConfig& risk);
    ClosedTrade close(const std::string& position_id, Decimal price, Timestamp ts, ExitReason reason);

    void mark(Decimal price);
    // Funding settles into realized PnL at close. Positive rate: longs pay shorts.
    void accrue_funding(Decimal rate, Decimal mark_price);

    // commissionRate * notional, rounded half-up to the price increment.
    Decimal fee_for(Decimal notional, Decimal rate) const;

    // False when marking, closing or funding every open position at price would
    // overflow the decimal range. Also covers the exit levels a new entry would freeze.
    bool in_range(Decimal price, std::optional<Decimal> funding_rate = std::nullopt) const;

    Decimal equity(Decimal mark_price) const;
    Decimal equity_at_last_mark() const;

    // Throws InvariantViolation when the conservation identity does not hold.
    void check_invariant() const;

    Decimal initial_capital() const { return initial_; }
    Decimal current_capital() const { return cash_; }
    Decimal realized_pnl() const { return realized_; }
    const std::vector<Position>& positions() const { return positions_; }
    const std::vector<ClosedTrade>& closed_trades() const { return closed_; }
    const FeeSchedule& fees() const { return fees_; }
    const InstrumentSpec& instrument() const { return instrument_; }

    // Rebuild from a persisted record.
    void restore(Decimal cash, std::vector<Position> positions, std::vector<ClosedTrade> closed);

private:
    Decimal initial_;
    Decimal cash_;
    Decimal realized_;
    FeeSchedule fees_;
    InstrumentSpec instrument_;
    std::vector<Position> positions_;
    std::vector<ClosedTrade> closed_;
    uint64_t next_position_seq_{1};
};

} // namespace tradeflow
