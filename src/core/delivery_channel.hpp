#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include "market_event.hpp"

namespace tradeflow {

/**
 * Bounded FIFO between the stream hub and one subscriber.
 *
 * push() never blocks: when the buffer is full the oldest buffered event is
 * evicted and the dropped counter is bumped. The remaining events keep their
 * relative order. close() is idempotent and wakes any waiting consumer.
 */
class DeliveryChannel {
public:
    explicit DeliveryChannel(size_t capacity = 256)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    DeliveryChannel(const DeliveryChannel&) = delete;
    DeliveryChannel& operator=(const DeliveryChannel&) = delete;

    // Returns false if the channel is closed.
    bool push(const MarketEvent& ev) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            if (buffer_.size() >= capacity_) {
                buffer_.pop_front();
                dropped_count_.fetch_add(1, std::memory_order_relaxed);
            }
            buffer_.push_back(ev);
        }
        cv_.notify_one();
        return true;
    }

    std::optional<MarketEvent> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (buffer_.empty()) return std::nullopt;
        MarketEvent ev = std::move(buffer_.front());
        buffer_.pop_front();
        return ev;
    }

    // Blocks until an event is available; nullopt once closed and drained.
    std::optional<MarketEvent> wait_and_pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&]{ return closed_ || !buffer_.empty(); });
        if (buffer_.empty()) return std::nullopt;
        MarketEvent ev = std::move(buffer_.front());
        buffer_.pop_front();
        return ev;
    }

    std::optional<MarketEvent> wait_and_pop_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [&]{ return closed_ || !buffer_.empty(); });
        if (buffer_.empty()) return std::nullopt;
        MarketEvent ev = std::move(buffer_.front());
        buffer_.pop_front();
        return ev;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    // Closed and nothing left to read.
    bool exhausted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ && buffer_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffer_.size();
    }

    size_t capacity() const { return capacity_; }

    uint64_t dropped() const {
        return dropped_count_.load(std::memory_order_relaxed);
    }

private:
    const size_t capacity_;
    std::deque<MarketEvent> buffer_;
    bool closed_{false};
    std::atomic<uint64_t> dropped_count_{0};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace tradeflow
