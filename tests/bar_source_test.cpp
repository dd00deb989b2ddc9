#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <cstdlib>
#include <unistd.h>
#include "../src/core/bar_source.hpp"

using namespace tradeflow;

namespace {

class BarSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/tradeflow_bars_XXXXXX";
        char* made = mkdtemp(tmpl);
        ASSERT_NE(made, nullptr);
        dir_ = made;
    }

    void TearDown() override {
        for (const auto& f : files_) std::remove(f.c_str());
        rmdir(dir_.c_str());
    }

    void write(const std::string& name, const std::string& contents) {
        std::string path = dir_ + "/" + name;
        std::ofstream out(path);
        out << contents;
        files_.push_back(path);
    }

    std::string dir_;
    std::vector<std::string> files_;
};

Timestamp ms(int64_t v) { return utils::ms_to_ts(v); }

} // namespace

TEST_F(BarSourceTest, ReadsObjectsAndKlineArraysInCloseTimeOrder) {
    write("BTCUSDT_1m.jsonl",
          "{\"open_time\": 120000, \"close_time\": 179999, \"open\": \"101\", \"high\": \"103\", "
          "\"low\": \"100\", \"close\": \"102.5\", \"volume\": \"7\"}\n"
          "[60000, \"100\", \"101\", \"99\", \"100.5\", \"3\", 119999, \"0\", 10]\n"
          "\n"
          "[0, \"99\", \"100\", \"98\", \"100\", \"2\", 59999]\n");
    JsonlBarSource source(dir_);
    auto bars = source.get_bars("btcusdt", "1m", ms(0), ms(1000000));
    ASSERT_EQ(bars.size(), 3u);
    EXPECT_EQ(bars[0].close_time, ms(59999));
    EXPECT_EQ(bars[1].close, *Decimal::parse("100.5"));
    EXPECT_EQ(bars[2].close, *Decimal::parse("102.5"));
    EXPECT_EQ(bars[2].symbol, "BTCUSDT");
}

TEST_F(BarSourceTest, FiltersByCloseTimeInclusive) {
    write("ETHUSDT_5m.jsonl",
          "[0, \"1\", \"1\", \"1\", \"1\", \"1\", 299999]\n"
          "[300000, \"2\", \"2\", \"2\", \"2\", \"1\", 599999]\n"
          "[600000, \"3\", \"3\", \"3\", \"3\", \"1\", 899999]\n");
    JsonlBarSource source(dir_);
    auto bars = source.get_bars("ETHUSDT", "5m", ms(299999), ms(599999));
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(bars[0].close, Decimal::from_int(1));
    EXPECT_EQ(bars[1].close, Decimal::from_int(2));
}

TEST_F(BarSourceTest, SkipsMalformedLines) {
    write("BTCUSDT_1h.jsonl",
          "not json\n"
          "{\"open_time\": 0, \"close\": \"5\"}\n"
          "[0, \"1\", \"1\", \"1\", \"42\", \"1\", 3599999]\n");
    JsonlBarSource source(dir_);
    auto bars = source.get_bars("BTCUSDT", "1h", ms(0), ms(10000000));
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_EQ(bars[0].close, Decimal::from_int(42));
}

TEST_F(BarSourceTest, MissingFileYieldsNoBars) {
    JsonlBarSource source(dir_);
    EXPECT_TRUE(source.get_bars("DOGEUSDT", "1m", ms(0), ms(1)).empty());
    EXPECT_EQ(source.path_for("dogeusdt", "1m"), dir_ + "/DOGEUSDT_1m.jsonl");
}

TEST(BarCloseEventTest, UsesCloseTimeAndPrice) {
    BarRecord bar;
    bar.symbol = "BTCUSDT";
    bar.close_time = utils::ms_to_ts(59999);
    bar.close = Decimal::from_int(100);
    bar.volume = Decimal::from_int(3);
    auto ev = to_bar_close_event(bar);
    EXPECT_EQ(ev.kind, EventKind::BAR_CLOSE);
    EXPECT_EQ(ev.timestamp, bar.close_time);
    EXPECT_EQ(ev.price, Decimal::from_int(100));
    EXPECT_EQ(*ev.quantity, Decimal::from_int(3));
}
