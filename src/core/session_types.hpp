#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "decimal.hpp"
#include "market_event.hpp"
#include "utils.hpp"

namespace tradeflow {

enum class SessionStatus { CREATED, ACTIVE, PAUSED, STOPPED };
enum class SessionMode { PAPER, BACKTEST, LIVE };
enum class PositionSide { LONG, SHORT };
enum class ExitReason { SIGNAL, STOP_LOSS, TAKE_PROFIT, MANUAL, END_OF_DATA };
enum class FundingPolicy { IGNORE, ACCRUE };
enum class SessionEventType { POSITION_OPENED, POSITION_CLOSED, ALERT, EQUITY_SAMPLE, STATUS_CHANGED };

const char* to_string(SessionStatus s);
const char* to_string(SessionMode m);
const char* to_string(PositionSide s);
const char* to_string(ExitReason r);
const char* to_string(FundingPolicy p);
const char* to_string(SessionEventType t);

std::optional<SessionStatus> parse_session_status(const std::string& s);
std::optional<SessionMode> parse_session_mode(const std::string& s);
std::optional<PositionSide> parse_position_side(const std::string& s);
std::optional<ExitReason> parse_exit_reason(const std::string& s);
std::optional<FundingPolicy> parse_funding_policy(const std::string& s);

struct RiskConfig {
    std::optional<Decimal> stop_loss_pct;      // 5 means 5%
    std::optional<Decimal> take_profit_pct;
    Decimal max_position_size_pct{Decimal::from_int(100)};
};

// Rates are fractions of notional; 0.001 = 10 bps.
struct FeeSchedule {
    Decimal entry_rate{Decimal::from_raw(100000)};
    Decimal exit_rate{Decimal::from_raw(100000)};
};

struct InstrumentSpec {
    Decimal price_increment{Decimal::from_raw(1000000)};  // 0.01
    Decimal quantity_step{Decimal::from_raw(1)};          // 1e-8
};

struct SessionConfig {
    std::string name;
    std::string strategy_ref;
    std::string symbol;
    std::string timeframe{"1m"};
    SessionMode mode{SessionMode::PAPER};
    std::string exchange{"binance"};
    Decimal initial_capital;
    RiskConfig risk;
    FeeSchedule fees;
    // Paper and backtest fills: buys at price*(1+rate), sells at price*(1-rate).
    Decimal slippage_rate;
    InstrumentSpec instrument;
    int max_open_positions{1};
    bool allow_short{true};
    FundingPolicy funding_policy{FundingPolicy::IGNORE};
    int64_t equity_sample_interval_sec{60};

    // Backtest range
    std::optional<Timestamp> start_time;
    std::optional<Timestamp> end_time;
    std::string bar_interval{"1m"};
};

// Session config pre-filled from the service defaults.
SessionConfig default_session_config(const SimulationConfig& sim);

// Throws ValidationError on the first violated bound.
void validate(const SessionConfig& cfg);

struct Position {
    std::string id;
    std::string symbol;
    PositionSide side{PositionSide::LONG};
    Decimal entry_price;
    Decimal quantity;
    Timestamp entry_time;
    Decimal notional_at_entry;
    Decimal entry_fee;
    std::optional<Decimal> stop_loss_price;    // frozen at entry
    std::optional<Decimal> take_profit_price;  // frozen at entry
    Decimal funding_accrued;
    Decimal last_mark_price;

    // Capital taken out of cash when the position was opened.
    Decimal allocated() const { return notional_at_entry + entry_fee; }

    Decimal gross_pnl(Decimal price) const {
        Decimal move = (price - entry_price) * quantity;
        return side == PositionSide::LONG ? move : -move;
    }

    // Entry fee is already out of cash, so it is not part of the position's value.
    Decimal mark_to_market(Decimal price) const {
        return notional_at_entry + gross_pnl(price) + funding_accrued;
    }
};

struct ClosedTrade {
    Position position;
    Decimal exit_price;
    Timestamp exit_time;
    ExitReason exit_reason{ExitReason::MANUAL};
    Decimal exit_fee;
    Decimal realized_pnl;
    Decimal fees_paid;
    double pnl_pct{0.0};
};

struct EquityPoint {
    Timestamp timestamp;
    Decimal equity;
};

struct SessionEvent {
    std::string session_id;
    SessionEventType type{SessionEventType::ALERT};
    Timestamp timestamp;
    nlohmann::json payload;
};

struct BacktestReport {
    int total_trades{0};
    int winning_trades{0};
    int losing_trades{0};
    double win_rate{0.0};
    Decimal total_pnl;
    Decimal total_fees;
    Decimal avg_win;
    Decimal avg_loss;
    Decimal largest_win;
    Decimal largest_loss;
    double profit_factor{0.0};
    double total_return_pct{0.0};
    double max_drawdown_pct{0.0};
    double sharpe_ratio{0.0};
    double volatility{0.0};
    Decimal final_capital;
    Decimal peak_capital;
    Decimal lowest_capital;
    std::map<std::string, int> exit_reasons;
};

struct SessionSnapshot {
    std::string id;
    SessionConfig config;
    SessionStatus status{SessionStatus::CREATED};
    Decimal current_capital;
    std::vector<Position> open_positions;
    std::vector<ClosedTrade> closed_trades;
    std::vector<EquityPoint> equity_curve;
    std::optional<Decimal> last_price;
    std::optional<Timestamp> last_event_time;
    uint64_t events_processed{0};
    uint64_t events_discarded{0};
    Timestamp created_at;
    std::optional<Timestamp> stopped_at;
    std::string stop_reason;
    std::optional<BacktestReport> report;
};

} // namespace tradeflow
