#include <gtest/gtest.h>
#include "../src/feeds/binance_format.hpp"

using namespace tradeflow;
using namespace tradeflow::binance_format;

TEST(BinanceFormatTest, StreamNames) {
    EXPECT_EQ(stream_name(make_key("BTCUSDT", EventKind::AGGREGATED_TRADE)), "btcusdt@aggTrade");
    EXPECT_EQ(stream_name(make_key("btcusdt", EventKind::TRADE)), "btcusdt@trade");
    EXPECT_EQ(stream_name(make_key("ETHUSDT", EventKind::FUNDING_RATE)), "ethusdt@markPrice");
    EXPECT_EQ(stream_name(make_key("ETHUSDT", EventKind::LIQUIDATION)), "ethusdt@forceOrder");
    EXPECT_EQ(stream_name(make_key("ETHUSDT", EventKind::BAR_CLOSE), "5m"), "ethusdt@kline_5m");
    EXPECT_TRUE(is_futures_stream(EventKind::FUNDING_RATE));
    EXPECT_TRUE(is_futures_stream(EventKind::LIQUIDATION));
    EXPECT_FALSE(is_futures_stream(EventKind::AGGREGATED_TRADE));
}

TEST(BinanceFormatTest, SubscribeMessages) {
    auto sub = nlohmann::json::parse(subscribe_message({"btcusdt@aggTrade", "btcusdt@trade"}, 7));
    EXPECT_EQ(sub["method"], "SUBSCRIBE");
    EXPECT_EQ(sub["params"].size(), 2u);
    EXPECT_EQ(sub["params"][0], "btcusdt@aggTrade");
    EXPECT_EQ(sub["id"], 7);
    auto unsub = nlohmann::json::parse(unsubscribe_message({"btcusdt@aggTrade"}, 8));
    EXPECT_EQ(unsub["method"], "UNSUBSCRIBE");
}

TEST(BinanceFormatTest, ParsesAggTradeWithAggressorSide) {
    const char* msg = R"({"e":"aggTrade","E":1700000000123,"s":"BTCUSDT","a":26129,"p":"0.01633102",
        "q":"4.70443515","f":27781,"l":27781,"T":1700000000100,"m":true,"M":true})";
    auto ev = parse_message(msg, EventKind::AGGREGATED_TRADE);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->symbol, "BTCUSDT");
    EXPECT_EQ(ev->kind, EventKind::AGGREGATED_TRADE);
    EXPECT_EQ(ev->sequence, 26129u);
    EXPECT_EQ(ev->price, *Decimal::parse("0.01633102"));
    EXPECT_EQ(*ev->quantity, *Decimal::parse("4.70443515"));
    EXPECT_EQ(utils::ts_to_ms(ev->timestamp), 1700000000100LL);
    EXPECT_EQ(*ev->side, Side::SELL);
}

TEST(BinanceFormatTest, UnwrapsCombinedStreamEnvelope) {
    const char* msg = R"({"stream":"btcusdt@trade","data":{"e":"trade","E":1700000000000,"s":"btcusdt",
        "t":12345,"p":"35000.5","q":"0.1","T":1700000000000,"m":false}})";
    auto ev = parse_message(msg, EventKind::TRADE);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->symbol, "BTCUSDT");
    EXPECT_EQ(ev->sequence, 12345u);
    EXPECT_EQ(*ev->side, Side::BUY);
}

TEST(BinanceFormatTest, ParsesMarkPriceAsFundingRate) {
    const char* msg = R"({"e":"markPriceUpdate","E":1562305380000,"s":"BTCUSDT","p":"11794.15000000",
        "i":"11784.62659091","r":"0.00038167","T":1562306400000})";
    auto ev = parse_message(msg, EventKind::FUNDING_RATE);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->kind, EventKind::FUNDING_RATE);
    EXPECT_EQ(ev->price, *Decimal::parse("11794.15"));
    EXPECT_EQ(*ev->funding_rate, *Decimal::parse("0.00038167"));
    EXPECT_EQ(utils::ts_to_ms(ev->timestamp), 1562305380000LL);
}

TEST(BinanceFormatTest, ParsesForceOrderUsingAveragePrice) {
    const char* msg = R"({"e":"forceOrder","E":1568014460893,"o":{"s":"BTCUSDT","S":"SELL","o":"LIMIT",
        "f":"IOC","q":"0.014","p":"9910","ap":"9910.5","X":"FILLED","l":"0.014","z":"0.012","T":1568014460893}})";
    auto ev = parse_message(msg, EventKind::LIQUIDATION);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->kind, EventKind::LIQUIDATION);
    EXPECT_EQ(ev->price, *Decimal::parse("9910.5"));
    EXPECT_EQ(*ev->quantity, *Decimal::parse("0.012"));
    EXPECT_EQ(*ev->side, Side::SELL);
}

TEST(BinanceFormatTest, OnlyClosedKlinesBecomeBarCloses) {
    std::string closed = R"({"e":"kline","E":1700000060001,"s":"BTCUSDT","k":{"t":1700000000000,
        "T":1700000059999,"s":"BTCUSDT","i":"1m","o":"100","c":"101.5","h":"102","l":"99","v":"12.5","x":true}})";
    auto ev = parse_message(closed, EventKind::BAR_CLOSE);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->price, *Decimal::parse("101.5"));
    EXPECT_EQ(*ev->quantity, *Decimal::parse("12.5"));
    EXPECT_EQ(utils::ts_to_ms(ev->timestamp), 1700000059999LL);

    std::string open = closed;
    open.replace(open.find("\"x\":true"), 8, "\"x\":false");
    EXPECT_FALSE(parse_message(open, EventKind::BAR_CLOSE).has_value());
}

TEST(BinanceFormatTest, RejectsAcksForeignKindsAndBadPayloads) {
    EXPECT_FALSE(parse_message(R"({"result":null,"id":1})", EventKind::TRADE).has_value());
    EXPECT_FALSE(parse_message("not json", EventKind::TRADE).has_value());
    const char* agg = R"({"e":"aggTrade","E":1,"s":"BTCUSDT","a":1,"p":"1","q":"1","T":1,"m":false})";
    EXPECT_FALSE(parse_message(agg, EventKind::TRADE).has_value());
    const char* zero = R"({"e":"aggTrade","E":1,"s":"BTCUSDT","a":1,"p":"0","q":"1","T":1,"m":false})";
    EXPECT_FALSE(parse_message(zero, EventKind::AGGREGATED_TRADE).has_value());
    const char* missing = R"({"e":"aggTrade","E":1,"s":"BTCUSDT","p":"1","q":"1","T":1})";
    EXPECT_FALSE(parse_message(missing, EventKind::AGGREGATED_TRADE).has_value());
}
