// =============================================================================
// portfolio_test.cpp
// =============================================================================
// Unit tests for backtest::Portfolio.
//
// Validates:
//   - Buy/sell cash arithmetic including commission
//   - Mark-to-market valuation and snapshots
//   - Every rejected transaction leaves the portfolio exactly as it was
//   - Realized P&L against average cost
//   - Dividends are credited only for held tickers
// =============================================================================

#include "backtest/core/errors.hpp"
#include "backtest/portfolio/portfolio.hpp"
#include "backtest/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <limits>
#include <string>

using backtest::domain::Side;
using backtest::domain::Transaction;

namespace {

Transaction makeTx(const std::string& ticker, Side side, double qty,
                   double price, double commission = 0.0) {
  Transaction tx;
  tx.timestamp = backtest::makeTimestamp(2024, 1, 2, 16);
  tx.ticker = ticker;
  tx.side = side;
  tx.quantity = qty;
  tx.price = price;
  tx.commission = commission;
  return tx;
}

}  // namespace

class PortfolioTest : public ::testing::Test {
 protected:
  PortfolioTest() : portfolio(100000.0, backtest::makeTimestamp(2024, 1, 1)) {}

  // Captures everything a rejected transaction must not change.
  struct State {
    double cash;
    double net_value;
    double realized;
    double commission;
    std::size_t holdings;
    std::size_t ledger;
  };

  State state() const {
    return {portfolio.cash(),           portfolio.netValue(),
            portfolio.realizedPnl(),    portfolio.totalCommission(),
            portfolio.holdings().size(), portfolio.ledger().size()};
  }

  void expectUnchanged(const State& before) const {
    const State after = state();
    EXPECT_EQ(after.cash, before.cash);
    EXPECT_EQ(after.net_value, before.net_value);
    EXPECT_EQ(after.realized, before.realized);
    EXPECT_EQ(after.commission, before.commission);
    EXPECT_EQ(after.holdings, before.holdings);
    EXPECT_EQ(after.ledger, before.ledger);
  }

  backtest::Portfolio portfolio;
};

// -----------------------------------------------------------------------------
// 1. Buy 10 AAPL @ 150 with 5 commission, mark at 152, sell 5 @ 155 with 5
//    commission.
// -----------------------------------------------------------------------------
TEST_F(PortfolioTest, BuyMarkSellArithmetic) {
  portfolio.applyTransaction(makeTx("AAPL", Side::Buy, 10.0, 150.0, 5.0));
  EXPECT_DOUBLE_EQ(portfolio.cash(), 98495.0);
  ASSERT_NE(portfolio.holding("AAPL"), nullptr);
  EXPECT_DOUBLE_EQ(portfolio.holding("AAPL")->quantity(), 10.0);

  portfolio.updateHoldingPrice("AAPL", 152.0);
  EXPECT_DOUBLE_EQ(portfolio.totalHoldingsValue(), 1520.0);
  EXPECT_DOUBLE_EQ(portfolio.netValue(), 100015.0);

  portfolio.applyTransaction(makeTx("AAPL", Side::Sell, 5.0, 155.0, 5.0));
  EXPECT_DOUBLE_EQ(portfolio.cash(), 99265.0);
  EXPECT_DOUBLE_EQ(portfolio.holding("AAPL")->quantity(), 5.0);
  EXPECT_DOUBLE_EQ(portfolio.holding("AAPL")->averageCost(), 150.0);
  EXPECT_DOUBLE_EQ(portfolio.realizedPnl(), 25.0);
  EXPECT_DOUBLE_EQ(portfolio.totalCommission(), 10.0);
  EXPECT_EQ(portfolio.ledger().size(), 2u);
}

// -----------------------------------------------------------------------------
// 2. Selling a ticker that is not held is a NotHeldError and changes nothing.
// -----------------------------------------------------------------------------
TEST_F(PortfolioTest, SellNotHeldLeavesStateUnchanged) {
  portfolio.applyTransaction(makeTx("MSFT", Side::Buy, 3.0, 300.0, 1.0));
  const State before = state();

  EXPECT_THROW(portfolio.applyTransaction(makeTx("AAPL", Side::Sell, 1.0, 150.0)),
               backtest::NotHeldError);
  expectUnchanged(before);
  EXPECT_EQ(portfolio.holding("AAPL"), nullptr);
}

// -----------------------------------------------------------------------------
// 3. A buy costing more than cash (commission included) is refused.
// -----------------------------------------------------------------------------
TEST_F(PortfolioTest, InsufficientFunds) {
  const State before = state();

  // Exactly affordable without commission, one unit over with it.
  EXPECT_THROW(
      portfolio.applyTransaction(makeTx("AAPL", Side::Buy, 1000.0, 100.0, 1.0)),
      backtest::InsufficientFundsError);
  expectUnchanged(before);

  EXPECT_NO_THROW(
      portfolio.applyTransaction(makeTx("AAPL", Side::Buy, 1000.0, 100.0, 0.0)));
  EXPECT_DOUBLE_EQ(portfolio.cash(), 0.0);
}

TEST_F(PortfolioTest, InsufficientPosition) {
  portfolio.applyTransaction(makeTx("AAPL", Side::Buy, 10.0, 150.0));
  const State before = state();

  EXPECT_THROW(portfolio.applyTransaction(makeTx("AAPL", Side::Sell, 11.0, 150.0)),
               backtest::InsufficientPositionError);
  expectUnchanged(before);
  EXPECT_DOUBLE_EQ(portfolio.holding("AAPL")->quantity(), 10.0);
}

TEST_F(PortfolioTest, SellCommissionMustBeCoveredByCash) {
  backtest::Portfolio small(1500.0, backtest::makeTimestamp(2024, 1, 1));
  small.applyTransaction(makeTx("AAPL", Side::Buy, 10.0, 150.0));
  ASSERT_DOUBLE_EQ(small.cash(), 0.0);

  EXPECT_THROW(small.applyTransaction(makeTx("AAPL", Side::Sell, 10.0, 150.0, 1.0)),
               backtest::InsufficientFundsError);
  EXPECT_DOUBLE_EQ(small.holding("AAPL")->quantity(), 10.0);
}

// -----------------------------------------------------------------------------
// 4. Contract checks fire before any domain check.
// -----------------------------------------------------------------------------
TEST_F(PortfolioTest, ContractViolations) {
  const State before = state();

  EXPECT_THROW(portfolio.applyTransaction(makeTx("", Side::Buy, 1.0, 1.0)),
               backtest::ContractViolation);
  EXPECT_THROW(portfolio.applyTransaction(makeTx("AAPL", Side::Buy, 0.0, 1.0)),
               backtest::ContractViolation);
  EXPECT_THROW(portfolio.applyTransaction(makeTx("AAPL", Side::Buy, 1.0, -1.0)),
               backtest::ContractViolation);
  EXPECT_THROW(portfolio.applyTransaction(makeTx("AAPL", Side::Buy, 1.0, 1.0, -0.5)),
               backtest::ContractViolation);
  // Quantity is checked before the holding lookup.
  EXPECT_THROW(portfolio.applyTransaction(makeTx("ZZZ", Side::Sell, -1.0, 1.0)),
               backtest::ContractViolation);

  EXPECT_THROW(portfolio.addCash(-1.0), backtest::ContractViolation);
  EXPECT_THROW(portfolio.removeCash(-1.0), backtest::ContractViolation);
  EXPECT_THROW(portfolio.updateHoldingPrice("AAPL", -1.0), backtest::ContractViolation);
  expectUnchanged(before);

  EXPECT_THROW(backtest::Portfolio(-1.0, backtest::makeTimestamp(2024, 1, 1)),
               backtest::ContractViolation);
}

TEST_F(PortfolioTest, NonFiniteValuesAreContractViolations) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();
  portfolio.applyTransaction(makeTx("AAPL", Side::Buy, 10.0, 100.0));
  const State before = state();

  EXPECT_THROW(portfolio.applyTransaction(makeTx("AAPL", Side::Buy, 1.0, nan)),
               backtest::ContractViolation);
  EXPECT_THROW(portfolio.applyTransaction(makeTx("AAPL", Side::Sell, 1.0, inf)),
               backtest::ContractViolation);
  EXPECT_THROW(portfolio.applyTransaction(makeTx("AAPL", Side::Buy, nan, 1.0)),
               backtest::ContractViolation);
  EXPECT_THROW(portfolio.applyTransaction(makeTx("AAPL", Side::Buy, 1.0, 1.0, nan)),
               backtest::ContractViolation);

  EXPECT_THROW(portfolio.addCash(nan), backtest::ContractViolation);
  EXPECT_THROW(portfolio.addCash(inf), backtest::ContractViolation);
  EXPECT_THROW(portfolio.removeCash(nan), backtest::ContractViolation);
  EXPECT_THROW(portfolio.updateHoldingPrice("AAPL", nan), backtest::ContractViolation);
  EXPECT_THROW(portfolio.updateHoldingPrice("AAPL", inf), backtest::ContractViolation);

  backtest::DividendEvent div;
  div.ticker = "AAPL";
  div.dividend_per_share = nan;
  EXPECT_THROW(portfolio.applyDividend(div), backtest::ContractViolation);
  expectUnchanged(before);
  EXPECT_DOUBLE_EQ(portfolio.holding("AAPL")->lastPrice(), 100.0);

  EXPECT_THROW(backtest::Portfolio(nan, backtest::makeTimestamp(2024, 1, 1)),
               backtest::ContractViolation);
}

TEST_F(PortfolioTest, UnknownSideIsRejected) {
  const State before = state();
  Transaction tx = makeTx("AAPL", Side::Buy, 1.0, 1.0);
  tx.side = static_cast<Side>(7);

  EXPECT_THROW(portfolio.applyTransaction(tx), backtest::UnknownTransactionTypeError);
  expectUnchanged(before);
}

// -----------------------------------------------------------------------------
// 5. Buying and selling at the same price without commission restores cash
//    exactly and closes the holding.
// -----------------------------------------------------------------------------
TEST_F(PortfolioTest, RoundTripRestoresCash) {
  portfolio.applyTransaction(makeTx("AAPL", Side::Buy, 7.0, 123.25));
  portfolio.applyTransaction(makeTx("AAPL", Side::Sell, 7.0, 123.25));

  EXPECT_DOUBLE_EQ(portfolio.cash(), 100000.0);
  EXPECT_DOUBLE_EQ(portfolio.realizedPnl(), 0.0);
  EXPECT_EQ(portfolio.holding("AAPL"), nullptr);
  EXPECT_TRUE(portfolio.holdings().empty());
}

// 0.3 - 0.1 - 0.1 leaves 0.09999999999999998 in binary floating point.
TEST_F(PortfolioTest, FractionalSellsCloseHolding) {
  portfolio.applyTransaction(makeTx("BTC", Side::Buy, 0.3, 100.0));
  for (int i = 0; i < 3; ++i) {
    portfolio.applyTransaction(makeTx("BTC", Side::Sell, 0.1, 100.0));
  }

  EXPECT_EQ(portfolio.holding("BTC"), nullptr);
  EXPECT_EQ(portfolio.ledger().size(), 4u);
  EXPECT_NEAR(portfolio.cash(), 100000.0, 1e-9);
  EXPECT_NEAR(portfolio.realizedPnl(), 0.0, 1e-9);
}

TEST_F(PortfolioTest, RealizedPnlUsesAverageCost) {
  portfolio.applyTransaction(makeTx("AAPL", Side::Buy, 10.0, 100.0));
  portfolio.applyTransaction(makeTx("AAPL", Side::Buy, 10.0, 120.0));
  portfolio.applyTransaction(makeTx("AAPL", Side::Sell, 5.0, 130.0));

  // Average 110, so 5 * (130 - 110).
  EXPECT_DOUBLE_EQ(portfolio.realizedPnl(), 100.0);
  EXPECT_DOUBLE_EQ(portfolio.holding("AAPL")->averageCost(), 110.0);
}

// -----------------------------------------------------------------------------
// 6. Marking an unheld ticker is a no-op.
// -----------------------------------------------------------------------------
TEST_F(PortfolioTest, MarkingUnheldTickerIsNoOp) {
  portfolio.updateHoldingPrice("AAPL", 150.0);
  EXPECT_TRUE(portfolio.holdings().empty());
  EXPECT_DOUBLE_EQ(portfolio.netValue(), 100000.0);
}

// -----------------------------------------------------------------------------
// 7. Dividends
// -----------------------------------------------------------------------------
TEST_F(PortfolioTest, DividendCreditsHeldTicker) {
  portfolio.applyTransaction(makeTx("AAPL", Side::Buy, 200.0, 100.0));

  backtest::DividendEvent div;
  div.ticker = "AAPL";
  div.dividend_per_share = 0.24;
  div.timestamp = backtest::makeTimestamp(2024, 2, 9);
  div.ex_date = div.timestamp;
  div.payment_date = div.timestamp;

  EXPECT_TRUE(portfolio.applyDividend(div));
  EXPECT_DOUBLE_EQ(portfolio.cash(), 80000.0 + 48.0);
  ASSERT_EQ(portfolio.dividends().size(), 1u);
  EXPECT_DOUBLE_EQ(portfolio.dividends()[0].amount, 48.0);
  EXPECT_DOUBLE_EQ(portfolio.dividends()[0].quantity_held, 200.0);
}

TEST_F(PortfolioTest, DividendOnUnheldTickerIsIgnored) {
  backtest::DividendEvent div;
  div.ticker = "MSFT";
  div.dividend_per_share = 0.75;

  EXPECT_FALSE(portfolio.applyDividend(div));
  EXPECT_DOUBLE_EQ(portfolio.cash(), 100000.0);
  EXPECT_TRUE(portfolio.dividends().empty());

  div.dividend_per_share = -0.1;
  EXPECT_THROW(portfolio.applyDividend(div), backtest::ContractViolation);
}

// -----------------------------------------------------------------------------
// 8. Snapshots copy state at the time they are taken.
// -----------------------------------------------------------------------------
TEST_F(PortfolioTest, SnapshotCapturesState) {
  portfolio.applyTransaction(makeTx("AAPL", Side::Buy, 10.0, 150.0));
  portfolio.updateHoldingPrice("AAPL", 160.0);

  const auto ts = backtest::makeTimestamp(2024, 1, 2, 16);
  const backtest::Snapshot snap = portfolio.recordSnapshot(ts);
  EXPECT_EQ(snap.timestamp, ts);
  EXPECT_DOUBLE_EQ(snap.cash, 98500.0);
  EXPECT_DOUBLE_EQ(snap.holdings_value, 1600.0);
  EXPECT_DOUBLE_EQ(snap.net_value, 100100.0);
  ASSERT_EQ(snap.holdings.size(), 1u);
  EXPECT_EQ(snap.holdings[0].ticker, "AAPL");

  portfolio.updateHoldingPrice("AAPL", 170.0);
  EXPECT_DOUBLE_EQ(portfolio.snapshots().back().net_value, 100100.0);
}

TEST_F(PortfolioTest, AdvanceTimeIgnoresBackwardMoves) {
  EXPECT_TRUE(portfolio.advanceTime(backtest::makeTimestamp(2024, 1, 3)));
  EXPECT_FALSE(portfolio.advanceTime(backtest::makeTimestamp(2024, 1, 2)));
  EXPECT_EQ(portfolio.currentTime(), backtest::makeTimestamp(2024, 1, 3));
}
