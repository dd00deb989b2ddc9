#include "bar_source.hpp"
#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace tradeflow {

namespace {

Timestamp read_time(const nlohmann::json& v) {
    if (v.is_string()) {
        auto ts = utils::parse_ts_any(v.get<std::string>());
        if (!ts) throw std::invalid_argument("bad timestamp " + v.get<std::string>());
        return *ts;
    }
    return utils::ms_to_ts(v.get<int64_t>());
}

BarRecord parse_bar(const std::string& symbol, const nlohmann::json& j) {
    BarRecord bar;
    bar.symbol = symbol;
    if (j.is_array()) {
        bar.open_time = utils::ms_to_ts(j.at(0).get<int64_t>());
        bar.open = j.at(1).get<Decimal>();
        bar.high = j.at(2).get<Decimal>();
        bar.low = j.at(3).get<Decimal>();
        bar.close = j.at(4).get<Decimal>();
        bar.volume = j.at(5).get<Decimal>();
        bar.close_time = utils::ms_to_ts(j.at(6).get<int64_t>());
        return bar;
    }
    bar.open_time = read_time(j.at("open_time"));
    bar.close_time = j.contains("close_time") ? read_time(j.at("close_time")) : bar.open_time;
    bar.open = j.at("open").get<Decimal>();
    bar.high = j.at("high").get<Decimal>();
    bar.low = j.at("low").get<Decimal>();
    bar.close = j.at("close").get<Decimal>();
    if (j.contains("volume")) bar.volume = j.at("volume").get<Decimal>();
    return bar;
}

} // namespace

MarketEvent to_bar_close_event(const BarRecord& bar) {
    MarketEvent ev;
    ev.symbol = bar.symbol;
    ev.kind = EventKind::BAR_CLOSE;
    ev.timestamp = bar.close_time;
    ev.price = bar.close;
    ev.quantity = bar.volume;
    return ev;
}

JsonlBarSource::JsonlBarSource(std::string directory)
    : directory_(std::move(directory)) {}

std::string JsonlBarSource::path_for(const std::string& symbol, const std::string& interval) const {
    return directory_ + "/" + utils::to_upper(symbol) + "_" + interval + ".jsonl";
}

std::vector<BarRecord> JsonlBarSource::get_bars(const std::string& symbol,
                                                const std::string& interval,
                                                Timestamp start_time,
                                                Timestamp end_time) {
    std::vector<BarRecord> bars;
    auto path = path_for(symbol, interval);
    std::ifstream in(path);
    if (!in.is_open()) {
        spdlog::warn("Bar file {} not found", path);
        return bars;
    }
    std::string upper = utils::to_upper(symbol);
    std::string line;
    size_t line_no = 0;
    size_t skipped = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;
        try {
            auto bar = parse_bar(upper, nlohmann::json::parse(line));
            if (bar.close_time < start_time || bar.close_time > end_time) continue;
            bars.push_back(std::move(bar));
        } catch (const std::exception& e) {
            ++skipped;
            spdlog::warn("{}:{}: skipping bar: {}", path, line_no, e.what());
        }
    }
    std::stable_sort(bars.begin(), bars.end(), [](const BarRecord& a, const BarRecord& b) {
        return a.close_time < b.close_time;
    });
    spdlog::info("Loaded {} {} bars for {} from {} ({} skipped)", bars.size(), interval, upper, path, skipped);
    return bars;
}

} // namespace tradeflow
