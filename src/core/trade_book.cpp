#include "trade_book.hpp"
#include "errors.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace tradeflow {

TradeBook::TradeBook(Decimal initial_capital, FeeSchedule fees, InstrumentSpec instrument)
    : initial_(initial_capital)
    , cash_(initial_capital)
    , fees_(fees)
    , instrument_(instrument) {}

Decimal TradeBook::fee_for(Decimal notional, Decimal rate) const {
    return (notional.abs() * rate).round_to(instrument_.price_increment);
}

std::optional<EntryPlan> TradeBook::plan_entry(Decimal price, Decimal max_position_pct) const {
    if (!price.is_positive() || !cash_.is_positive()) return std::nullopt;
    Decimal budget = min(percent_of(cash_, max_position_pct), cash_);
    Decimal qty = (budget / price).floor_to(instrument_.quantity_step);
    if (!qty.is_positive()) return std::nullopt;
    EntryPlan plan;
    plan.quantity = qty;
    plan.notional = qty * price;
    plan.fee = fee_for(plan.notional, fees_.entry_rate);
    return plan;
}

const Position& TradeBook::open(const std::string& symbol, PositionSide side, Decimal price,
                                const EntryPlan& plan, Timestamp ts, const RiskConfig& risk) {
    Position pos;
    pos.id = fmt::format("P{}", next_position_seq_++);
    pos.symbol = symbol;
    pos.side = side;
    pos.entry_price = price;
    pos.quantity = plan.quantity;
    pos.entry_time = ts;
    pos.notional_at_entry = plan.notional;
    pos.entry_fee = plan.fee;
    pos.last_mark_price = price;

    const Decimal hundred = Decimal::from_int(100);
    const Decimal one = Decimal::from_int(1);
    const Decimal tick = instrument_.price_increment;
    if (risk.stop_loss_pct) {
        Decimal f = *risk.stop_loss_pct / hundred;
        pos.stop_loss_price = (side == PositionSide::LONG ? price * (one - f) : price * (one + f)).round_to(tick);
    }
    if (risk.take_profit_pct) {
        Decimal f = *risk.take_profit_pct / hundred;
        pos.take_profit_price = (side == PositionSide::LONG ? price * (one + f) : price * (one - f)).round_to(tick);
    }

    cash_ -= pos.allocated();
    positions_.push_back(std::move(pos));
    return positions_.back();
}

ClosedTrade TradeBook::close(const std::string& position_id, Decimal price, Timestamp ts, ExitReason reason) {
    auto it = std::find_if(positions_.begin(), positions_.end(),
                           [&](const Position& p) { return p.id == position_id; });
    if (it == positions_.end()) {
        throw InvariantViolation("close of unknown position " + position_id);
    }
    ClosedTrade trade;
    trade.position = *it;
    trade.position.last_mark_price = price;
    trade.exit_price = price;
    trade.exit_time = ts;
    trade.exit_reason = reason;
    trade.exit_fee = fee_for(price * it->quantity, fees_.exit_rate);
    trade.fees_paid = it->entry_fee + trade.exit_fee;
    trade.realized_pnl = it->gross_pnl(price) - trade.fees_paid + it->funding_accrued;
    Decimal allocated = it->allocated();
    if (allocated.is_positive()) {
        trade.pnl_pct = trade.realized_pnl.to_double() / allocated.to_double() * 100.0;
    }

    cash_ += allocated + trade.realized_pnl;
    realized_ += trade.realized_pnl;
    positions_.erase(it);
    closed_.push_back(trade);
    return trade;
}

void TradeBook::mark(Decimal price) {
    for (auto& p : positions_) p.last_mark_price = price;
}

void TradeBook::accrue_funding(Decimal rate, Decimal mark_price) {
    for (auto& p : positions_) {
        Decimal payment = (rate * p.quantity * mark_price).round_to(instrument_.price_increment);
        if (p.side == PositionSide::LONG) {
            p.funding_accrued -= payment;
        } else {
            p.funding_accrued += payment;
        }
    }
}

bool TradeBook::in_range(Decimal price, std::optional<Decimal> funding_rate) const {
    try {
        // Stop-loss and take-profit are bounded by 100%, so frozen levels stay under 2x.
        (void)(price * Decimal::from_int(2)).round_to(instrument_.price_increment);
        Decimal cash = cash_;
        Decimal realized = realized_;
        for (const auto& p : positions_) {
            Decimal funding = p.funding_accrued;
            if (funding_rate) {
                Decimal payment = (*funding_rate * p.quantity * price).round_to(instrument_.price_increment).abs();
                (void)(funding + payment);
                funding = funding - payment;
            }
            Decimal exit_fee = fee_for(price * p.quantity, fees_.exit_rate);
            Decimal pnl = p.gross_pnl(price) - p.entry_fee - exit_fee + funding;
            (void)(p.notional_at_entry + p.gross_pnl(price) + funding);
            cash += p.allocated() + pnl;
            realized += pnl;
        }
        (void)equity(price);
        return true;
    } catch (const std::overflow_error&) {
        return false;
    }
}

Decimal TradeBook::equity(Decimal mark_price) const {
    Decimal total = cash_;
    for (const auto& p : positions_) total += p.mark_to_market(mark_price);
    return total;
}

Decimal TradeBook::equity_at_last_mark() const {
    Decimal total = cash_;
    for (const auto& p : positions_) total += p.mark_to_market(p.last_mark_price);
    return total;
}

void TradeBook::check_invariant() const {
    Decimal allocated;
    for (const auto& p : positions_) {
        if (!p.quantity.is_positive()) {
            throw InvariantViolation(fmt::format("position {} has non-positive quantity {}",
                                                 p.id, p.quantity.to_string()));
        }
        allocated += p.allocated();
    }
    Decimal realized;
    for (const auto& t : closed_) realized += t.realized_pnl;
    if (realized != realized_) {
        throw InvariantViolation(fmt::format("realized pnl drift: log={} running={}",
                                             realized.to_string(), realized_.to_string()));
    }
    Decimal lhs = cash_ + allocated;
    Decimal rhs = initial_ + realized;
    if (lhs != rhs) {
        throw InvariantViolation(fmt::format("capital not conserved: cash+allocated={} initial+realized={}",
                                             lhs.to_string(), rhs.to_string()));
    }
}

void TradeBook::restore(Decimal cash, std::vector<Position> positions, std::vector<ClosedTrade> closed) {
    cash_ = cash;
    positions_ = std::move(positions);
    closed_ = std::move(closed);
    realized_ = Decimal{};
    for (const auto& t : closed_) realized_ += t.realized_pnl;
    next_position_seq_ = positions_.size() + closed_.size() + 1;
}

} // namespace tradeflow
