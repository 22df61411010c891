// =============================================================================
// strategy_test.cpp
// =============================================================================
// Unit tests for BuyAndHoldStrategy and MovingAverageCrossStrategy.
// =============================================================================

#include "backtest/core/errors.hpp"
#include "backtest/strategy/buy_and_hold_strategy.hpp"
#include "backtest/strategy/moving_average_cross_strategy.hpp"
#include "backtest/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using backtest::domain::Side;

namespace {

backtest::MarketUpdateEvent bar(const std::string& ticker, double price, int day) {
  backtest::MarketUpdateEvent md;
  md.ticker = ticker;
  md.price = price;
  md.timestamp = backtest::makeTimestamp(2024, 1, day, 16);
  return md;
}

}  // namespace

// -----------------------------------------------------------------------------
// BuyAndHoldStrategy
// -----------------------------------------------------------------------------
TEST(BuyAndHoldStrategyTest, BuysEachTargetOnce) {
  backtest::BuyAndHoldStrategy strategy("bh", {{"AAPL", 200.0}, {"MSFT", 100.0}});

  const auto first = strategy.calculateSignals(bar("AAPL", 185.0, 2));
  ASSERT_EQ(first.size(), 1u);
  EXPECT_EQ(first[0].strategy_id, "bh");
  EXPECT_EQ(first[0].ticker, "AAPL");
  EXPECT_EQ(first[0].side, Side::Buy);
  ASSERT_TRUE(first[0].suggested_quantity.has_value());
  EXPECT_DOUBLE_EQ(*first[0].suggested_quantity, 200.0);
  EXPECT_EQ(first[0].timestamp, backtest::makeTimestamp(2024, 1, 2, 16));

  EXPECT_TRUE(strategy.calculateSignals(bar("AAPL", 186.0, 3)).empty());
  EXPECT_TRUE(strategy.calculateSignals(bar("SPY", 470.0, 3)).empty());

  const auto msft = strategy.calculateSignals(bar("MSFT", 370.0, 3));
  ASSERT_EQ(msft.size(), 1u);
  EXPECT_DOUBLE_EQ(*msft[0].suggested_quantity, 100.0);
}

TEST(BuyAndHoldStrategyTest, SubscribesToTargets) {
  backtest::BuyAndHoldStrategy strategy("bh", {{"MSFT", 1.0}, {"AAPL", 1.0}});
  EXPECT_EQ(strategy.subscribedTickers(), (std::vector<std::string>{"AAPL", "MSFT"}));
  EXPECT_EQ(strategy.id(), "bh");
}

TEST(BuyAndHoldStrategyTest, RejectsBadConfiguration) {
  EXPECT_THROW(backtest::BuyAndHoldStrategy("", {{"AAPL", 1.0}}),
               backtest::ContractViolation);
  EXPECT_THROW(backtest::BuyAndHoldStrategy("bh", {}), backtest::ContractViolation);
  EXPECT_THROW(backtest::BuyAndHoldStrategy("bh", {{"AAPL", 0.0}}),
               backtest::ContractViolation);
}

// -----------------------------------------------------------------------------
// MovingAverageCrossStrategy
// -----------------------------------------------------------------------------
class MovingAverageCrossTest : public ::testing::Test {
 protected:
  static backtest::MovingAverageCrossStrategy::Params params() {
    backtest::MovingAverageCrossStrategy::Params p;
    p.tickers = {"AAPL"};
    p.fast_window = 2;
    p.slow_window = 3;
    p.quantity = 50.0;
    return p;
  }

  std::vector<backtest::SignalEvent> feed(const std::vector<double>& prices) {
    std::vector<backtest::SignalEvent> all;
    int day = 1;
    for (double price : prices) {
      for (auto& signal : strategy.calculateSignals(bar("AAPL", price, day++))) {
        all.push_back(signal);
      }
    }
    return all;
  }

  backtest::MovingAverageCrossStrategy strategy{"sma", params()};
};

// -----------------------------------------------------------------------------
// Flat prices fill the window without a cross; a jump crosses up, a drop
// crosses back down.
// -----------------------------------------------------------------------------
TEST_F(MovingAverageCrossTest, BuysOnUpCrossAndSellsOnDownCross) {
  // Spreads from the third price on: 0, +0.5, +1, -1, -2.
  const auto signals = feed({10.0, 10.0, 10.0, 13.0, 13.0, 7.0, 7.0});
  ASSERT_EQ(signals.size(), 2u);

  EXPECT_EQ(signals[0].side, Side::Buy);
  EXPECT_DOUBLE_EQ(*signals[0].suggested_quantity, 50.0);
  EXPECT_EQ(signals[0].timestamp, backtest::makeTimestamp(2024, 1, 4, 16));
  ASSERT_TRUE(signals[0].strength.has_value());
  EXPECT_NEAR(*signals[0].strength, 0.5 / 11.0, 1e-12);

  EXPECT_EQ(signals[1].side, Side::Sell);
  EXPECT_EQ(signals[1].timestamp, backtest::makeTimestamp(2024, 1, 6, 16));
}

TEST_F(MovingAverageCrossTest, NoSignalBeforeWindowIsFull) {
  EXPECT_TRUE(feed({10.0, 20.0}).empty());
}

TEST_F(MovingAverageCrossTest, NeverSellsWithoutPriorBuy) {
  // Starts above, then crosses down while flat.
  EXPECT_TRUE(feed({10.0, 10.0, 13.0, 7.0, 7.0}).empty());
}

TEST_F(MovingAverageCrossTest, IgnoresOtherTickers) {
  EXPECT_TRUE(strategy.calculateSignals(bar("MSFT", 300.0, 2)).empty());
  EXPECT_EQ(strategy.subscribedTickers(), (std::vector<std::string>{"AAPL"}));
}

TEST(MovingAverageCrossConfigTest, RejectsBadWindows) {
  backtest::MovingAverageCrossStrategy::Params p;
  p.tickers = {"AAPL"};
  p.quantity = 1.0;

  p.fast_window = 5;
  p.slow_window = 5;
  EXPECT_THROW(backtest::MovingAverageCrossStrategy("sma", p), backtest::ContractViolation);

  p.fast_window = 0;
  EXPECT_THROW(backtest::MovingAverageCrossStrategy("sma", p), backtest::ContractViolation);

  p.fast_window = 2;
  p.quantity = 0.0;
  EXPECT_THROW(backtest::MovingAverageCrossStrategy("sma", p), backtest::ContractViolation);

  p.quantity = 1.0;
  p.tickers.clear();
  EXPECT_THROW(backtest::MovingAverageCrossStrategy("sma", p), backtest::ContractViolation);
}
