#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "utils.hpp"

namespace tradeflow {

enum class Signal { NEUTRAL, BUY, SELL };

inline const char* to_string(Signal s) {
    switch (s) {
        case Signal::BUY: return "BUY";
        case Signal::SELL: return "SELL";
        case Signal::NEUTRAL: return "NEUTRAL";
    }
    return "NEUTRAL";
}

inline std::optional<Signal> parse_signal(const std::string& s) {
    auto u = utils::to_upper(s);
    if (u == "BUY") return Signal::BUY;
    if (u == "SELL") return Signal::SELL;
    if (u == "NEUTRAL" || u == "HOLD") return Signal::NEUTRAL;
    return std::nullopt;
}

/**
 * Query side of the strategy collaborator. Must be side-effect free for the caller.
 */
class SignalProvider {
public:
    virtual ~SignalProvider() = default;
    virtual Signal get_signal(const std::string& symbol, const std::string& timeframe) = 0;
};

/**
 * Latest signal per (symbol, timeframe), written by the upstream indicator
 * service through the control API. Unknown keys and expired entries read as NEUTRAL.
 */
class SignalBoard : public SignalProvider {
public:
    struct Entry {
        std::string symbol;
        std::string timeframe;
        Signal signal{Signal::NEUTRAL};
        Timestamp updated_at;
        std::optional<Timestamp> expires_at;
    };

    void set(const std::string& symbol, const std::string& timeframe, Signal signal,
             std::optional<std::chrono::seconds> ttl = std::nullopt) {
        auto now = std::chrono::system_clock::now();
        Entry e{utils::to_upper(symbol), timeframe, signal, now, std::nullopt};
        if (ttl) e.expires_at = now + *ttl;
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[key(e.symbol, timeframe)] = std::move(e);
    }

    Signal get_signal(const std::string& symbol, const std::string& timeframe) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key(utils::to_upper(symbol), timeframe));
        if (it == entries_.end()) return Signal::NEUTRAL;
        if (it->second.expires_at && std::chrono::system_clock::now() >= *it->second.expires_at) {
            return Signal::NEUTRAL;
        }
        return it->second.signal;
    }

    std::vector<Entry> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Entry> out;
        out.reserve(entries_.size());
        for (const auto& kv : entries_) out.push_back(kv.second);
        return out;
    }

private:
    static std::string key(const std::string& symbol, const std::string& timeframe) {
        return symbol + "|" + timeframe;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace tradeflow
