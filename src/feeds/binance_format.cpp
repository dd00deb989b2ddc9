#include "binance_format.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "../core/utils.hpp"

using json = nlohmann::json;

namespace tradeflow {
namespace binance_format {

namespace {

Decimal decimal_field(const json& j, const char* key) {
    const auto& v = j.at(key);
    if (v.is_string()) {
        auto d = Decimal::parse(v.get<std::string>());
        if (!d) throw std::invalid_argument(std::string("bad decimal in field ") + key);
        return *d;
    }
    return v.get<Decimal>();
}

Timestamp time_field(const json& j, const char* key) {
    return utils::ms_to_ts(j.at(key).get<int64_t>());
}

MarketEvent parse_trade(const json& d, EventKind kind) {
    MarketEvent ev;
    ev.kind = kind;
    ev.symbol = utils::to_upper(d.at("s").get<std::string>());
    ev.sequence = d.at(kind == EventKind::AGGREGATED_TRADE ? "a" : "t").get<uint64_t>();
    ev.price = decimal_field(d, "p");
    ev.quantity = decimal_field(d, "q");
    ev.timestamp = time_field(d, d.contains("T") ? "T" : "E");
    // Buyer is maker: the aggressor sold.
    ev.side = d.value("m", false) ? Side::SELL : Side::BUY;
    return ev;
}

MarketEvent parse_mark_price(const json& d) {
    MarketEvent ev;
    ev.kind = EventKind::FUNDING_RATE;
    ev.symbol = utils::to_upper(d.at("s").get<std::string>());
    ev.price = decimal_field(d, "p");
    ev.funding_rate = decimal_field(d, "r");
    ev.timestamp = time_field(d, "E");
    return ev;
}

MarketEvent parse_force_order(const json& d) {
    const auto& o = d.at("o");
    MarketEvent ev;
    ev.kind = EventKind::LIQUIDATION;
    ev.symbol = utils::to_upper(o.at("s").get<std::string>());
    Decimal avg = o.contains("ap") ? decimal_field(o, "ap") : Decimal{};
    ev.price = avg.is_positive() ? avg : decimal_field(o, "p");
    ev.quantity = o.contains("z") ? decimal_field(o, "z") : decimal_field(o, "q");
    ev.side = utils::to_upper(o.at("S").get<std::string>()) == "SELL" ? Side::SELL : Side::BUY;
    ev.timestamp = time_field(o, o.contains("T") ? "T" : "E");
    return ev;
}

std::optional<MarketEvent> parse_kline(const json& d) {
    const auto& k = d.at("k");
    if (!k.value("x", false)) return std::nullopt;
    MarketEvent ev;
    ev.kind = EventKind::BAR_CLOSE;
    ev.symbol = utils::to_upper(k.at("s").get<std::string>());
    ev.price = decimal_field(k, "c");
    ev.quantity = decimal_field(k, "v");
    ev.timestamp = time_field(k, "T");
    ev.sequence = static_cast<uint64_t>(k.at("t").get<int64_t>());
    return ev;
}

std::string request(const char* method, const std::vector<std::string>& streams, uint64_t id) {
    json j;
    j["method"] = method;
    j["params"] = streams;
    j["id"] = id;
    return j.dump();
}

} // namespace

bool is_futures_stream(EventKind kind) {
    return kind == EventKind::FUNDING_RATE || kind == EventKind::LIQUIDATION;
}

std::string stream_name(const StreamKey& key, const std::string& kline_interval) {
    std::string sym = utils::to_lower(key.symbol);
    switch (key.kind) {
        case EventKind::TRADE: return sym + "@trade";
        case EventKind::AGGREGATED_TRADE: return sym + "@aggTrade";
        case EventKind::FUNDING_RATE: return sym + "@markPrice";
        case EventKind::LIQUIDATION: return sym + "@forceOrder";
        case EventKind::BAR_CLOSE: return sym + "@kline_" + kline_interval;
    }
    return sym;
}

std::string subscribe_message(const std::vector<std::string>& streams, uint64_t request_id) {
    return request("SUBSCRIBE", streams, request_id);
}

std::string unsubscribe_message(const std::vector<std::string>& streams, uint64_t request_id) {
    return request("UNSUBSCRIBE", streams, request_id);
}

std::optional<MarketEvent> parse_message(const std::string& payload, EventKind expected) {
    std::optional<MarketEvent> ev;
    try {
        json j = json::parse(payload);
        if (j.contains("data") && j["data"].is_object()) j = j["data"];
        if (!j.is_object() || !j.contains("e")) {
            // {"result":null,"id":1} acks and anything else without an event type
            return std::nullopt;
        }
        std::string type = j["e"].get<std::string>();
        if (type == "aggTrade" && expected == EventKind::AGGREGATED_TRADE) {
            ev = parse_trade(j, EventKind::AGGREGATED_TRADE);
        } else if (type == "trade" && expected == EventKind::TRADE) {
            ev = parse_trade(j, EventKind::TRADE);
        } else if (type == "markPriceUpdate" && expected == EventKind::FUNDING_RATE) {
            ev = parse_mark_price(j);
        } else if (type == "forceOrder" && expected == EventKind::LIQUIDATION) {
            ev = parse_force_order(j);
        } else if (type == "kline" && expected == EventKind::BAR_CLOSE) {
            ev = parse_kline(j);
        } else {
            spdlog::debug("Binance: ignoring {} message on {} stream", type, to_string(expected));
            return std::nullopt;
        }
    } catch (const std::exception& e) {
        spdlog::debug("Binance: discarding malformed message: {}", e.what());
        return std::nullopt;
    }
    if (ev && !ev->price.is_positive()) {
        spdlog::debug("Binance: discarding {} {} with non-positive price {}",
                      ev->symbol, to_string(ev->kind), ev->price.to_string());
        return std::nullopt;
    }
    return ev;
}

} // namespace binance_format
} // namespace tradeflow
