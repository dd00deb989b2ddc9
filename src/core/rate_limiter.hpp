#pragma once

#include <unordered_map>
#include <chrono>
#include <mutex>
#include <string>

namespace tradeflow {

/**
 * Fixed-window request counter per key. Used by the control API (per client)
 * and by exchange gateways (per venue weight budget).
 */
class RateLimiter {
public:
    RateLimiter(size_t max_requests_per_window = 120, std::chrono::seconds window = std::chrono::seconds(60))
        : max_requests_(max_requests_per_window), window_(window) {}

    bool allow(const std::string& key) {
        auto now = clock::now();
        std::lock_guard<std::mutex> lock(mu_);
        auto& entry = bucket(key, now);
        if (entry.count >= max_requests_) return false;
        ++entry.count;
        return true;
    }

    // Time until the key's window rolls over; zero when a request would be allowed now.
    std::chrono::milliseconds retry_after(const std::string& key) {
        auto now = clock::now();
        std::lock_guard<std::mutex> lock(mu_);
        auto& entry = bucket(key, now);
        if (entry.count < max_requests_) return std::chrono::milliseconds(0);
        return std::chrono::duration_cast<std::chrono::milliseconds>(entry.window_start + window_ - now);
    }

    size_t limit() const { return max_requests_; }

private:
    using clock = std::chrono::steady_clock;

    struct Bucket {
        clock::time_point window_start{clock::now()};
        size_t count{0};
    };

    Bucket& bucket(const std::string& key, clock::time_point now) {
        auto& entry = buckets_[key];
        if (now - entry.window_start >= window_) {
            entry.window_start = now;
            entry.count = 0;
        }
        return entry;
    }

    size_t max_requests_;
    std::chrono::seconds window_;
    std::unordered_map<std::string, Bucket> buckets_;
    std::mutex mu_;
};

} // namespace tradeflow
