#include <gtest/gtest.h>
#include "../src/core/backoff.hpp"

using namespace tradeflow;
using std::chrono::milliseconds;

TEST(BackoffTest, CeilingDoublesUpToCap) {
    Backoff b(milliseconds(1000), milliseconds(30000), 42);
    EXPECT_EQ(b.ceiling_for(0), milliseconds(1000));
    EXPECT_EQ(b.ceiling_for(1), milliseconds(2000));
    EXPECT_EQ(b.ceiling_for(4), milliseconds(16000));
    EXPECT_EQ(b.ceiling_for(5), milliseconds(30000));
    EXPECT_EQ(b.ceiling_for(60), milliseconds(30000));
}

TEST(BackoffTest, DelaysStayInsideJitterWindow) {
    Backoff b(milliseconds(100), milliseconds(1000), 7);
    for (int i = 0; i < 20; ++i) {
        auto ceiling = b.ceiling_for(b.attempt());
        auto d = b.next_delay();
        EXPECT_GE(d.count(), 0);
        EXPECT_LE(d, ceiling);
    }
    EXPECT_EQ(b.attempt(), 20);
}

TEST(BackoffTest, ResetStartsOver) {
    Backoff b(milliseconds(100), milliseconds(1000), 7);
    b.next_delay();
    b.next_delay();
    b.reset();
    EXPECT_EQ(b.attempt(), 0);
    EXPECT_LE(b.next_delay(), milliseconds(100));
}
