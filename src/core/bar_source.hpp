#pragma once

#include <string>
#include <vector>
#include "decimal.hpp"
#include "market_event.hpp"
#include "utils.hpp"

namespace tradeflow {

struct BarRecord {
    std::string symbol;
    Timestamp open_time;
    Timestamp close_time;
    Decimal open;
    Decimal high;
    Decimal low;
    Decimal close;
    Decimal volume;
};

// Closed bar as the engine consumes it: a bar_close event at the close price.
MarketEvent to_bar_close_event(const BarRecord& bar);

/**
 * Historical bars for backtests, in chronological order.
 */
class BarSource {
public:
    virtual ~BarSource() = default;

    // Bars whose close time falls in [start_time, end_time].
    virtual std::vector<BarRecord> get_bars(const std::string& symbol,
                                            const std::string& interval,
                                            Timestamp start_time,
                                            Timestamp end_time) = 0;
};

/**
 * Reads `<directory>/<SYMBOL>_<interval>.jsonl`, one bar per line:
 * {"open_time": ms, "close_time": ms, "open": "..", "high": "..", "low": "..", "close": "..", "volume": ".."}
 * Binance kline arrays ([open_time, open, high, low, close, volume, close_time, ...]) are accepted too.
 * Unparseable lines are skipped with a warning.
 */
class JsonlBarSource : public BarSource {
public:
    explicit JsonlBarSource(std::string directory);

    std::vector<BarRecord> get_bars(const std::string& symbol,
                                    const std::string& interval,
                                    Timestamp start_time,
                                    Timestamp end_time) override;

    std::string path_for(const std::string& symbol, const std::string& interval) const;

private:
    std::string directory_;
};

} // namespace tradeflow
