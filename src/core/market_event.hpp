#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include "decimal.hpp"
#include "utils.hpp"

namespace tradeflow {

enum class EventKind {
    TRADE,
    AGGREGATED_TRADE,
    FUNDING_RATE,
    LIQUIDATION,
    BAR_CLOSE
};

enum class Side { BUY, SELL };

inline const char* to_string(EventKind kind) {
    switch (kind) {
        case EventKind::TRADE: return "trade";
        case EventKind::AGGREGATED_TRADE: return "aggregated_trade";
        case EventKind::FUNDING_RATE: return "funding_rate";
        case EventKind::LIQUIDATION: return "liquidation";
        case EventKind::BAR_CLOSE: return "bar_close";
    }
    return "unknown";
}

inline std::optional<EventKind> parse_event_kind(const std::string& s) {
    if (s == "trade") return EventKind::TRADE;
    if (s == "aggregated_trade" || s == "aggTrade") return EventKind::AGGREGATED_TRADE;
    if (s == "funding_rate") return EventKind::FUNDING_RATE;
    if (s == "liquidation") return EventKind::LIQUIDATION;
    if (s == "bar_close") return EventKind::BAR_CLOSE;
    return std::nullopt;
}

inline const char* to_string(Side side) {
    return side == Side::BUY ? "buy" : "sell";
}

/**
 * Canonical market data event emitted by a feed adapter.
 *
 * Delivered by copy to every subscriber; nothing downstream mutates it.
 * `sequence` carries the venue sequence id (aggregate trade id, trade id)
 * when the venue provides one, otherwise 0.
 */
struct MarketEvent {
    std::string symbol;
    EventKind kind{EventKind::TRADE};
    Timestamp timestamp;
    uint64_t sequence{0};
    Decimal price;
    std::optional<Decimal> quantity;
    std::optional<Side> side;
    std::optional<Decimal> funding_rate;  // FUNDING_RATE only
};

struct StreamKey {
    std::string symbol;
    EventKind kind{EventKind::TRADE};

    bool operator==(const StreamKey& o) const { return kind == o.kind && symbol == o.symbol; }
    bool operator!=(const StreamKey& o) const { return !(*this == o); }

    std::string to_string() const { return symbol + "@" + tradeflow::to_string(kind); }
};

struct StreamKeyHash {
    size_t operator()(const StreamKey& k) const {
        return std::hash<std::string>{}(k.symbol) ^ (static_cast<size_t>(k.kind) * 0x9e3779b97f4a7c15ULL);
    }
};

inline StreamKey make_key(const std::string& symbol, EventKind kind) {
    return StreamKey{utils::to_upper(symbol), kind};
}

} // namespace tradeflow
