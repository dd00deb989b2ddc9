#include <gtest/gtest.h>
#include "../src/core/errors.hpp"
#include "../src/core/trade_book.hpp"

using namespace tradeflow;

namespace {

Decimal d(const char* s) { return *Decimal::parse(s); }

Timestamp at(int64_t sec) { return utils::ms_to_ts(1700000000000LL + sec * 1000); }

} // namespace

TEST(TradeBookTest, PlanUsesWholeBudgetAtMaxSize) {
    TradeBook book(Decimal::from_int(10000), FeeSchedule{}, InstrumentSpec{});
    auto plan = book.plan_entry(Decimal::from_int(100), Decimal::from_int(100));
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->quantity, Decimal::from_int(100));
    EXPECT_EQ(plan->notional, Decimal::from_int(10000));
    EXPECT_EQ(plan->fee, Decimal::from_int(10));
}

TEST(TradeBookTest, PlanRespectsPositionSizeAndQuantityStep) {
    InstrumentSpec spec;
    spec.quantity_step = d("0.001");
    TradeBook book(Decimal::from_int(1000), FeeSchedule{}, spec);
    auto plan = book.plan_entry(d("333.33"), Decimal::from_int(50));
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->quantity, d("1.5"));
    EXPECT_LE(plan->notional, Decimal::from_int(500));
}

TEST(TradeBookTest, NoPlanWithoutCashOrPrice) {
    TradeBook book(Decimal::from_int(10), FeeSchedule{}, InstrumentSpec{});
    EXPECT_FALSE(book.plan_entry(Decimal{}, Decimal::from_int(100)).has_value());
    InstrumentSpec coarse;
    coarse.quantity_step = Decimal::from_int(1);
    TradeBook small(Decimal::from_int(10), FeeSchedule{}, coarse);
    EXPECT_FALSE(small.plan_entry(Decimal::from_int(100), Decimal::from_int(100)).has_value());
}

TEST(TradeBookTest, LongRoundTripConservesCapital) {
    TradeBook book(Decimal::from_int(10000), FeeSchedule{}, InstrumentSpec{});
    auto plan = *book.plan_entry(Decimal::from_int(100), Decimal::from_int(100));
    const auto& pos = book.open("BTCUSDT", PositionSide::LONG, Decimal::from_int(100), plan, at(0), RiskConfig{});
    std::string id = pos.id;
    EXPECT_EQ(book.current_capital(), Decimal::from_int(-10));
    EXPECT_NO_THROW(book.check_invariant());

    auto trade = book.close(id, Decimal::from_int(110), at(60), ExitReason::SIGNAL);
    EXPECT_EQ(trade.exit_fee, Decimal::from_int(11));
    EXPECT_EQ(trade.fees_paid, Decimal::from_int(21));
    EXPECT_EQ(trade.realized_pnl, Decimal::from_int(979));
    EXPECT_EQ(book.current_capital(), Decimal::from_int(10979));
    EXPECT_TRUE(book.positions().empty());
    EXPECT_NO_THROW(book.check_invariant());
}

TEST(TradeBookTest, ShortProfitsWhenPriceFalls) {
    TradeBook book(Decimal::from_int(10000), FeeSchedule{}, InstrumentSpec{});
    auto plan = *book.plan_entry(Decimal::from_int(100), Decimal::from_int(100));
    std::string id = book.open("BTCUSDT", PositionSide::SHORT, Decimal::from_int(100), plan, at(0), RiskConfig{}).id;
    EXPECT_EQ(book.equity(Decimal::from_int(90)), Decimal::from_int(10990));
    auto trade = book.close(id, Decimal::from_int(90), at(1), ExitReason::TAKE_PROFIT);
    // gross 1000, fees 10 + 9
    EXPECT_EQ(trade.realized_pnl, Decimal::from_int(981));
    EXPECT_NO_THROW(book.check_invariant());
}

TEST(TradeBookTest, StopAndTargetPricesAreFrozenAtEntry) {
    TradeBook book(Decimal::from_int(10000), FeeSchedule{}, InstrumentSpec{});
    RiskConfig risk;
    risk.stop_loss_pct = Decimal::from_int(5);
    risk.take_profit_pct = Decimal::from_int(10);
    auto plan = *book.plan_entry(Decimal::from_int(200), Decimal::from_int(50));
    const auto& lng = book.open("ETHUSDT", PositionSide::LONG, Decimal::from_int(200), plan, at(0), risk);
    EXPECT_EQ(*lng.stop_loss_price, Decimal::from_int(190));
    EXPECT_EQ(*lng.take_profit_price, Decimal::from_int(220));
    auto plan2 = *book.plan_entry(Decimal::from_int(200), Decimal::from_int(50));
    const auto& sht = book.open("ETHUSDT", PositionSide::SHORT, Decimal::from_int(200), plan2, at(0), risk);
    EXPECT_EQ(*sht.stop_loss_price, Decimal::from_int(210));
    EXPECT_EQ(*sht.take_profit_price, Decimal::from_int(180));
}

TEST(TradeBookTest, FeesRoundHalfUpToPriceIncrement) {
    TradeBook book(Decimal::from_int(10000), FeeSchedule{}, InstrumentSpec{});
    EXPECT_EQ(book.fee_for(d("12.345"), d("0.001")), d("0.01"));
    EXPECT_EQ(book.fee_for(d("5"), d("0.001")), d("0.01"));
    EXPECT_EQ(book.fee_for(d("4.9"), d("0.001")), Decimal{});
}

TEST(TradeBookTest, FundingSettlesIntoRealizedPnl) {
    FeeSchedule free;
    free.entry_rate = Decimal{};
    free.exit_rate = Decimal{};
    TradeBook book(Decimal::from_int(10000), free, InstrumentSpec{});
    auto plan = *book.plan_entry(Decimal::from_int(100), Decimal::from_int(100));
    std::string id = book.open("BTCUSDT", PositionSide::LONG, Decimal::from_int(100), plan, at(0), RiskConfig{}).id;
    book.accrue_funding(d("0.0001"), Decimal::from_int(100));
    EXPECT_EQ(book.positions().front().funding_accrued, Decimal::from_int(-1));
    EXPECT_NO_THROW(book.check_invariant());
    auto trade = book.close(id, Decimal::from_int(100), at(1), ExitReason::MANUAL);
    EXPECT_EQ(trade.realized_pnl, Decimal::from_int(-1));
    EXPECT_EQ(book.current_capital(), Decimal::from_int(9999));
    EXPECT_NO_THROW(book.check_invariant());
}

TEST(TradeBookTest, ClosingUnknownPositionIsAnInvariantViolation) {
    TradeBook book(Decimal::from_int(100), FeeSchedule{}, InstrumentSpec{});
    EXPECT_THROW(book.close("P42", Decimal::from_int(1), at(0), ExitReason::MANUAL), InvariantViolation);
}

TEST(TradeBookTest, ManyRoundTripsStayConserved) {
    TradeBook book(Decimal::from_int(5000), FeeSchedule{}, InstrumentSpec{});
    Decimal price = d("101.37");
    for (int i = 0; i < 200; ++i) {
        auto plan = book.plan_entry(price, Decimal::from_int(30));
        ASSERT_TRUE(plan.has_value());
        auto side = i % 2 == 0 ? PositionSide::LONG : PositionSide::SHORT;
        std::string id = book.open("BTCUSDT", side, price, *plan, at(i), RiskConfig{}).id;
        price = price + d("0.73") - (i % 3 == 0 ? d("1.9") : Decimal{});
        book.close(id, price, at(i), ExitReason::SIGNAL);
        ASSERT_NO_THROW(book.check_invariant());
    }
    EXPECT_EQ(book.closed_trades().size(), 200u);
}

TEST(TradeBookTest, RestoreRebuildsRealizedPnl) {
    TradeBook book(Decimal::from_int(10000), FeeSchedule{}, InstrumentSpec{});
    auto plan = *book.plan_entry(Decimal::from_int(100), Decimal::from_int(100));
    std::string id = book.open("BTCUSDT", PositionSide::LONG, Decimal::from_int(100), plan, at(0), RiskConfig{}).id;
    book.close(id, Decimal::from_int(110), at(1), ExitReason::SIGNAL);

    TradeBook copy(Decimal::from_int(10000), FeeSchedule{}, InstrumentSpec{});
    copy.restore(book.current_capital(), book.positions(), book.closed_trades());
    EXPECT_EQ(copy.realized_pnl(), Decimal::from_int(979));
    EXPECT_NO_THROW(copy.check_invariant());
}
