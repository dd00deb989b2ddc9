#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include "market_event.hpp"

namespace tradeflow {

/**
 * Per-(symbol, kind) ordering guard applied by adapters before emission.
 *
 * An event is admitted only if it moves its stream forward: by venue sequence
 * id when both sides carry one, otherwise by exchange timestamp. Equal
 * timestamps without a sequence id are admitted (several trades per
 * millisecond are normal). Gaps are fine.
 */
class EventSequencer {
public:
    bool admit(const MarketEvent& ev) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& last = last_[StreamKey{ev.symbol, ev.kind}];
        if (last.seen) {
            if (ev.sequence != 0 && last.sequence != 0) {
                if (ev.sequence <= last.sequence) {
                    ++rejected_;
                    return false;
                }
            } else if (ev.timestamp < last.timestamp) {
                ++rejected_;
                return false;
            }
        }
        last.seen = true;
        last.sequence = ev.sequence;
        last.timestamp = ev.timestamp;
        return true;
    }

    // Forget stream positions; used when a reconnect should accept a fresh sequence space.
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        last_.clear();
    }

    uint64_t rejected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rejected_;
    }

private:
    struct Last {
        bool seen{false};
        uint64_t sequence{0};
        Timestamp timestamp;
    };
    mutable std::mutex mutex_;
    std::unordered_map<StreamKey, Last, StreamKeyHash> last_;
    uint64_t rejected_{0};
};

} // namespace tradeflow
