#pragma once

#include <vector>
#include "session_types.hpp"

namespace tradeflow {

struct PerformanceMetrics {
    double total_return{0.0};
    double max_drawdown{0.0};
    double sharpe{0.0};
    double volatility{0.0};
};

/**
 * Append-only equity curve for one session.
 * Owned by the session's worker; readers get copies through snapshots.
 */
class PerformanceTracker {
public:
    // Append-only; points sharing a timestamp are kept in arrival order.
    void record(Timestamp ts, Decimal equity);
    const std::vector<EquityPoint>& points() const { return series_; }
    std::optional<Timestamp> last_timestamp() const;
    PerformanceMetrics metrics() const;

private:
    std::vector<EquityPoint> series_;
};

PerformanceMetrics compute_metrics(const std::vector<EquityPoint>& series);

// Trade statistics for a finished run.
BacktestReport compute_report(Decimal initial_capital,
                              Decimal final_capital,
                              const std::vector<ClosedTrade>& trades,
                              const std::vector<EquityPoint>& equity);

} // namespace tradeflow
