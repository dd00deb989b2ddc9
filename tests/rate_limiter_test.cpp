#include <gtest/gtest.h>
#include "../src/core/rate_limiter.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace tradeflow;

TEST(RateLimiterTest, AllowsWithinLimit) {
    RateLimiter rl(5, std::chrono::seconds(1));
    int allowed = 0;
    for (int i = 0; i < 5; ++i) {
        if (rl.allow("k")) ++allowed;
    }
    EXPECT_EQ(allowed, 5);
    EXPECT_FALSE(rl.allow("k"));
}

TEST(RateLimiterTest, ResetsAfterWindow) {
    RateLimiter rl(2, std::chrono::seconds(1));
    EXPECT_TRUE(rl.allow("k"));
    EXPECT_TRUE(rl.allow("k"));
    EXPECT_FALSE(rl.allow("k"));
    std::this_thread::sleep_for(std::chrono::seconds(1));
    EXPECT_TRUE(rl.allow("k"));
}

TEST(RateLimiterTest, KeysAreIndependent) {
    RateLimiter rl(1, std::chrono::seconds(60));
    EXPECT_TRUE(rl.allow("10.0.0.1"));
    EXPECT_TRUE(rl.allow("10.0.0.2"));
    EXPECT_FALSE(rl.allow("10.0.0.1"));
}

TEST(RateLimiterTest, RetryAfterReportsRemainingWindow) {
    RateLimiter rl(1, std::chrono::seconds(60));
    EXPECT_EQ(rl.retry_after("binance").count(), 0);
    EXPECT_TRUE(rl.allow("binance"));
    auto wait = rl.retry_after("binance");
    EXPECT_GT(wait.count(), 0);
    EXPECT_LE(wait, std::chrono::milliseconds(60000));
}

TEST(RateLimiterTest, ConcurrentCallersShareBudget) {
    RateLimiter rl(100, std::chrono::seconds(60));
    std::atomic<int> allowed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 50; ++i) {
                if (rl.allow("shared")) allowed.fetch_add(1);
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(allowed.load(), 100);
}
