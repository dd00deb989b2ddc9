#include <gtest/gtest.h>
#include <thread>
#include "../src/core/signal_provider.hpp"

using namespace tradeflow;

TEST(SignalBoardTest, UnknownKeyIsNeutral) {
    SignalBoard board;
    EXPECT_EQ(board.get_signal("BTCUSDT", "1m"), Signal::NEUTRAL);
}

TEST(SignalBoardTest, LatestWriteWinsPerSymbolAndTimeframe) {
    SignalBoard board;
    board.set("btcusdt", "1m", Signal::BUY);
    board.set("BTCUSDT", "5m", Signal::SELL);
    EXPECT_EQ(board.get_signal("BTCUSDT", "1m"), Signal::BUY);
    EXPECT_EQ(board.get_signal("BTCUSDT", "5m"), Signal::SELL);
    board.set("BTCUSDT", "1m", Signal::SELL);
    EXPECT_EQ(board.get_signal("BTCUSDT", "1m"), Signal::SELL);
    EXPECT_EQ(board.entries().size(), 2u);
}

TEST(SignalBoardTest, ExpiredEntryReadsNeutral) {
    SignalBoard board;
    board.set("ETHUSDT", "1m", Signal::BUY, std::chrono::seconds(1));
    EXPECT_EQ(board.get_signal("ETHUSDT", "1m"), Signal::BUY);
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    EXPECT_EQ(board.get_signal("ETHUSDT", "1m"), Signal::NEUTRAL);
}

TEST(SignalBoardTest, ParsesSignalNames) {
    EXPECT_EQ(parse_signal("buy"), Signal::BUY);
    EXPECT_EQ(parse_signal("SELL"), Signal::SELL);
    EXPECT_EQ(parse_signal("hold"), Signal::NEUTRAL);
    EXPECT_FALSE(parse_signal("maybe").has_value());
}
