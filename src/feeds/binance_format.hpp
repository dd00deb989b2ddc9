#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "../core/market_event.hpp"

namespace tradeflow {
namespace binance_format {

// Spot streams (trade, aggTrade, kline) vs USD-M futures streams (markPrice, forceOrder).
bool is_futures_stream(EventKind kind);

// "btcusdt@aggTrade", "btcusdt@kline_1m", ...
std::string stream_name(const StreamKey& key, const std::string& kline_interval = "1m");

std::string subscribe_message(const std::vector<std::string>& streams, uint64_t request_id);
std::string unsubscribe_message(const std::vector<std::string>& streams, uint64_t request_id);

/**
 * Decode one WebSocket text frame into a canonical event of the expected kind.
 *
 * Accepts raw payloads and combined-stream envelopes ({"stream":..,"data":..}).
 * Returns nullopt for subscription acks, open klines, other kinds, malformed
 * JSON and non-positive prices; the rejects are logged at debug level.
 */
std::optional<MarketEvent> parse_message(const std::string& payload, EventKind expected);

} // namespace binance_format
} // namespace tradeflow
