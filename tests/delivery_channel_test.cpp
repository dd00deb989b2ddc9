#include <gtest/gtest.h>
#include <thread>
#include "../src/core/delivery_channel.hpp"

using namespace tradeflow;

namespace {

MarketEvent trade(uint64_t seq) {
    MarketEvent ev;
    ev.symbol = "BTCUSDT";
    ev.sequence = seq;
    ev.price = Decimal::from_int(100);
    return ev;
}

} // namespace

TEST(DeliveryChannelTest, FifoOrder) {
    DeliveryChannel ch(8);
    for (uint64_t i = 1; i <= 3; ++i) ch.push(trade(i));
    EXPECT_EQ(ch.try_pop()->sequence, 1u);
    EXPECT_EQ(ch.try_pop()->sequence, 2u);
    EXPECT_EQ(ch.try_pop()->sequence, 3u);
    EXPECT_FALSE(ch.try_pop().has_value());
}

TEST(DeliveryChannelTest, DropsOldestWhenFull) {
    DeliveryChannel ch(3);
    for (uint64_t i = 1; i <= 5; ++i) ch.push(trade(i));
    EXPECT_EQ(ch.size(), 3u);
    EXPECT_EQ(ch.dropped(), 2u);
    EXPECT_EQ(ch.try_pop()->sequence, 3u);
    EXPECT_EQ(ch.try_pop()->sequence, 4u);
    EXPECT_EQ(ch.try_pop()->sequence, 5u);
}

TEST(DeliveryChannelTest, CloseWakesWaiterAndRejectsPush) {
    DeliveryChannel ch(4);
    std::optional<MarketEvent> got = trade(99);
    std::thread waiter([&]() { got = ch.wait_and_pop(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ch.close();
    waiter.join();
    EXPECT_FALSE(got.has_value());
    EXPECT_FALSE(ch.push(trade(1)));
    EXPECT_TRUE(ch.exhausted());
    ch.close();
    EXPECT_TRUE(ch.closed());
}

TEST(DeliveryChannelTest, DrainsBufferedEventsAfterClose) {
    DeliveryChannel ch(4);
    ch.push(trade(1));
    ch.close();
    EXPECT_FALSE(ch.exhausted());
    EXPECT_EQ(ch.wait_and_pop()->sequence, 1u);
    EXPECT_FALSE(ch.wait_and_pop().has_value());
}

TEST(DeliveryChannelTest, TimedPopReturnsEmptyOnTimeout) {
    DeliveryChannel ch(4);
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(ch.wait_and_pop_for(std::chrono::milliseconds(30)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(25));
}
