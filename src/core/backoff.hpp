#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>

namespace tradeflow {

/**
 * Exponential backoff with full jitter.
 *
 * next_delay() returns uniform(0, min(cap, base * 2^attempt)) and advances the
 * attempt counter. reset() after a successful connect.
 */
class Backoff {
public:
    Backoff(std::chrono::milliseconds base = std::chrono::milliseconds(1000),
            std::chrono::milliseconds cap = std::chrono::milliseconds(30000),
            uint64_t seed = std::random_device{}())
        : base_(base), cap_(cap), rng_(seed) {}

    std::chrono::milliseconds next_delay() {
        auto ceiling = ceiling_for(attempt_);
        if (attempt_ < 62) ++attempt_;
        std::uniform_int_distribution<int64_t> dist(0, ceiling.count());
        return std::chrono::milliseconds(dist(rng_));
    }

    // Upper bound of the jitter window for a given attempt.
    std::chrono::milliseconds ceiling_for(int attempt) const {
        int64_t ceiling = base_.count();
        for (int i = 0; i < attempt && ceiling < cap_.count(); ++i) {
            ceiling *= 2;
        }
        return std::chrono::milliseconds(std::min<int64_t>(ceiling, cap_.count()));
    }

    void reset() { attempt_ = 0; }
    int attempt() const { return attempt_; }

private:
    std::chrono::milliseconds base_;
    std::chrono::milliseconds cap_;
    int attempt_{0};
    std::mt19937_64 rng_;
};

} // namespace tradeflow
