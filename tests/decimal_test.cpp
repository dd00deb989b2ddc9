#include <gtest/gtest.h>
#include "../src/core/decimal.hpp"
#include <limits>
#include <stdexcept>

using namespace tradeflow;

TEST(DecimalTest, ParsesAndFormats) {
    auto d = Decimal::parse("123.45");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->raw(), 12345000000LL);
    EXPECT_EQ(d->to_string(), "123.45");
    EXPECT_EQ(Decimal::parse("-0.5")->to_string(), "-0.5");
    EXPECT_EQ(Decimal::parse("7")->to_string(), "7");
    EXPECT_EQ(Decimal::parse("0.00000001")->raw(), 1);
}

TEST(DecimalTest, RejectsGarbage) {
    EXPECT_FALSE(Decimal::parse("").has_value());
    EXPECT_FALSE(Decimal::parse("abc").has_value());
    EXPECT_FALSE(Decimal::parse("1.2.3").has_value());
    EXPECT_FALSE(Decimal::parse("-").has_value());
}

TEST(DecimalTest, RoundsNinthDigitHalfUp) {
    EXPECT_EQ(Decimal::parse("0.000000015")->raw(), 2);
    EXPECT_EQ(Decimal::parse("0.000000014")->raw(), 1);
}

TEST(DecimalTest, RepeatedAdditionIsExact) {
    Decimal sum;
    auto tenth = *Decimal::parse("0.1");
    for (int i = 0; i < 1000; ++i) sum += tenth;
    EXPECT_EQ(sum, Decimal::from_int(100));
}

TEST(DecimalTest, MultiplyAndDivide) {
    auto price = *Decimal::parse("100.5");
    auto qty = *Decimal::parse("2");
    EXPECT_EQ((price * qty).to_string(), "201");
    EXPECT_EQ((Decimal::from_int(1) / Decimal::from_int(3)).to_string(), "0.33333333");
    EXPECT_EQ((Decimal::from_int(2) / Decimal::from_int(3)).to_string(), "0.66666667");
    EXPECT_THROW(Decimal::from_int(1) / Decimal{}, std::domain_error);
}

TEST(DecimalTest, RoundAndFloorToStep) {
    auto cent = *Decimal::parse("0.01");
    EXPECT_EQ(Decimal::parse("1.005")->round_to(cent).to_string(), "1.01");
    EXPECT_EQ(Decimal::parse("1.004")->round_to(cent).to_string(), "1");
    EXPECT_EQ(Decimal::parse("1.009")->floor_to(cent).to_string(), "1");
    EXPECT_EQ(Decimal::parse("-1.005")->round_to(cent).to_string(), "-1.01");
}

TEST(DecimalTest, PercentOf) {
    EXPECT_EQ(percent_of(Decimal::from_int(10000), Decimal::from_int(5)), Decimal::from_int(500));
}

TEST(DecimalTest, JsonAcceptsStringsAndNumbers) {
    nlohmann::json j = Decimal::from_int(3);
    EXPECT_EQ(j, "3");
    EXPECT_EQ(nlohmann::json("1.25").get<Decimal>().to_string(), "1.25");
    EXPECT_EQ(nlohmann::json(42).get<Decimal>(), Decimal::from_int(42));
    EXPECT_EQ(nlohmann::json(0.5).get<Decimal>().to_string(), "0.5");
    EXPECT_THROW(nlohmann::json(true).get<Decimal>(), std::invalid_argument);
}

TEST(DecimalTest, OutOfRangeInputsAreRejected) {
    EXPECT_THROW(nlohmann::json(1e12).get<Decimal>(), std::out_of_range);
    EXPECT_THROW(nlohmann::json(-1e12).get<Decimal>(), std::out_of_range);
    EXPECT_THROW(nlohmann::json(int64_t{1000000000000}).get<Decimal>(), std::out_of_range);
    EXPECT_THROW(nlohmann::json(uint64_t{18000000000000000000ULL}).get<Decimal>(), std::out_of_range);
    EXPECT_THROW(Decimal::from_int(1000000000000LL), std::out_of_range);
    EXPECT_FALSE(Decimal::parse("92233720368.99999999").has_value());
    EXPECT_FALSE(Decimal::parse("-92233720368.99999999").has_value());
    EXPECT_FALSE(Decimal::parse("100000000000").has_value());

    auto edge = Decimal::parse("92233720368.54775807");
    ASSERT_TRUE(edge.has_value());
    EXPECT_EQ(edge->raw(), std::numeric_limits<int64_t>::max());
    EXPECT_EQ(Decimal::from_int(Decimal::MAX_WHOLE).to_string(), "92233720368");
}

TEST(DecimalTest, ArithmeticOverflowThrows) {
    Decimal big = Decimal::from_int(90000000000LL);
    EXPECT_THROW(big + big, std::overflow_error);
    EXPECT_THROW(-big - big, std::overflow_error);
    EXPECT_THROW(big * Decimal::from_int(2), std::overflow_error);
    Decimal acc = big;
    EXPECT_THROW(acc += big, std::overflow_error);
    EXPECT_EQ(acc, big);
    EXPECT_THROW(-Decimal::from_raw(std::numeric_limits<int64_t>::min()), std::overflow_error);
}
