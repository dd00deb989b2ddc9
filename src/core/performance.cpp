#include "performance.hpp"
#include <cmath>

namespace tradeflow {

void PerformanceTracker::record(Timestamp ts, Decimal equity) {
    series_.push_back({ts, equity});
}

std::optional<Timestamp> PerformanceTracker::last_timestamp() const {
    if (series_.empty()) return std::nullopt;
    return series_.back().timestamp;
}

PerformanceMetrics PerformanceTracker::metrics() const {
    return compute_metrics(series_);
}

PerformanceMetrics compute_metrics(const std::vector<EquityPoint>& series) {
    PerformanceMetrics out;
    if (series.size() < 2) return out;

    double start = series.front().equity.to_double();
    double end = series.back().equity.to_double();
    if (start != 0.0) out.total_return = (end - start) / start;

    double peak = start;
    double max_dd = 0.0;
    for (const auto& p : series) {
        double eq = p.equity.to_double();
        if (eq > peak) peak = eq;
        double dd = peak > 0.0 ? (peak - eq) / peak : 0.0;
        if (dd > max_dd) max_dd = dd;
    }
    out.max_drawdown = max_dd;

    std::vector<double> rets;
    rets.reserve(series.size() - 1);
    for (size_t i = 1; i < series.size(); ++i) {
        double prev = series[i - 1].equity.to_double();
        double cur = series[i].equity.to_double();
        if (prev != 0.0) rets.push_back((cur - prev) / prev);
    }
    if (rets.size() >= 2) {
        double mean = 0.0;
        for (double r : rets) mean += r;
        mean /= static_cast<double>(rets.size());
        double var = 0.0;
        for (double r : rets) {
            double d = r - mean;
            var += d * d;
        }
        var /= static_cast<double>(rets.size() - 1);
        double stddev = std::sqrt(var);
        out.volatility = stddev;
        if (stddev > 0.0) {
            // Crypto trades every day of the year.
            out.sharpe = mean / stddev * std::sqrt(365.0);
        }
    }
    return out;
}

BacktestReport compute_report(Decimal initial_capital,
                              Decimal final_capital,
                              const std::vector<ClosedTrade>& trades,
                              const std::vector<EquityPoint>& equity) {
    BacktestReport r;
    r.total_trades = static_cast<int>(trades.size());
    Decimal gross_wins;
    Decimal gross_losses;
    for (const auto& t : trades) {
        r.total_pnl += t.realized_pnl;
        r.total_fees += t.fees_paid;
        r.exit_reasons[to_string(t.exit_reason)]++;
        if (t.realized_pnl.is_positive()) {
            ++r.winning_trades;
            gross_wins += t.realized_pnl;
            if (t.realized_pnl > r.largest_win) r.largest_win = t.realized_pnl;
        } else if (t.realized_pnl.is_negative()) {
            ++r.losing_trades;
            gross_losses += t.realized_pnl;
            if (t.realized_pnl < r.largest_loss) r.largest_loss = t.realized_pnl;
        }
    }
    if (r.total_trades > 0) {
        r.win_rate = static_cast<double>(r.winning_trades) / r.total_trades * 100.0;
    }
    if (r.winning_trades > 0) r.avg_win = gross_wins / Decimal::from_int(r.winning_trades);
    if (r.losing_trades > 0) r.avg_loss = gross_losses / Decimal::from_int(r.losing_trades);
    if (!gross_losses.is_zero()) {
        r.profit_factor = gross_wins.to_double() / gross_losses.abs().to_double();
    }

    r.final_capital = final_capital;
    r.peak_capital = initial_capital;
    r.lowest_capital = initial_capital;
    for (const auto& p : equity) {
        r.peak_capital = max(r.peak_capital, p.equity);
        r.lowest_capital = min(r.lowest_capital, p.equity);
    }
    r.peak_capital = max(r.peak_capital, final_capital);
    r.lowest_capital = min(r.lowest_capital, final_capital);

    if (initial_capital.is_positive()) {
        r.total_return_pct = (final_capital - initial_capital).to_double() / initial_capital.to_double() * 100.0;
    }
    auto m = compute_metrics(equity);
    r.max_drawdown_pct = m.max_drawdown * 100.0;
    r.sharpe_ratio = m.sharpe;
    r.volatility = m.volatility;
    return r;
}

} // namespace tradeflow
