// =============================================================================
// backtest_report_test.cpp
// =============================================================================
// Unit tests for summarize(), printSummary() and the results JSON.
// =============================================================================

#include "backtest/core/errors.hpp"
#include "backtest/engine/backtest_report.hpp"
#include "backtest/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using backtest::makeTimestamp;

namespace {

backtest::Snapshot snapshotAt(int day, double net_value) {
  backtest::Snapshot snap;
  snap.timestamp = makeTimestamp(2024, 1, day, 16);
  snap.net_value = net_value;
  snap.cash = net_value;
  return snap;
}

}  // namespace

class BacktestReportTest : public ::testing::Test {
 protected:
  void SetUp() override {
    result.settings.start = makeTimestamp(2024, 1, 2);
    result.settings.end = makeTimestamp(2024, 1, 5, 23, 59, 59);
    result.settings.initial_cash = 1000.0;
    result.settings.benchmark = "SPY";

    // Peak 1200, trough 900: drawdown 25 %.
    result.snapshots = {snapshotAt(2, 1000.0), snapshotAt(3, 1200.0),
                        snapshotAt(4, 900.0), snapshotAt(5, 1100.0)};

    backtest::domain::Transaction tx;
    tx.timestamp = makeTimestamp(2024, 1, 2, 16);
    tx.ticker = "AAPL";
    tx.quantity = 5.0;
    tx.price = 100.0;
    tx.commission = 1.0;
    tx.order_id = 1;
    result.ledger = {tx};

    backtest::DividendRecord div;
    div.timestamp = makeTimestamp(2024, 1, 4);
    div.ticker = "AAPL";
    div.quantity_held = 5.0;
    div.dividend_per_share = 0.5;
    div.amount = 2.5;
    result.dividends = {div};

    result.final_cash = 500.0;
    result.final_net_value = 1100.0;
    result.realized_pnl = 0.0;
    result.total_commission = 1.0;
    result.stats.fills_applied = 1;
  }

  backtest::BacktestResult result;
};

TEST_F(BacktestReportTest, Summarize) {
  const auto s = backtest::summarize(result);
  EXPECT_DOUBLE_EQ(s.total_return, 0.1);
  EXPECT_DOUBLE_EQ(s.max_drawdown, 0.25);
  EXPECT_DOUBLE_EQ(s.total_dividends, 2.5);
  EXPECT_DOUBLE_EQ(s.total_commission, 1.0);
  EXPECT_EQ(s.trades, 1u);
  EXPECT_EQ(s.snapshots, 4u);
}

TEST_F(BacktestReportTest, ZeroInitialCashHasZeroReturn) {
  result.settings.initial_cash = 0.0;
  EXPECT_DOUBLE_EQ(backtest::summarize(result).total_return, 0.0);
}

TEST_F(BacktestReportTest, PrintSummaryRestoresStreamState) {
  std::ostringstream out;
  out.precision(3);
  backtest::printSummary(out, backtest::summarize(result));

  const std::string text = out.str();
  EXPECT_NE(text.find("Total return:      10.00 %"), std::string::npos) << text;
  EXPECT_NE(text.find("Max drawdown:      25.00 %"), std::string::npos) << text;
  EXPECT_EQ(out.precision(), 3);
}

TEST_F(BacktestReportTest, ResultJson) {
  const auto j = backtest::resultToJson(result);

  EXPECT_EQ(j["settings"]["benchmark"], "SPY");
  EXPECT_EQ(j["settings"]["start"], "2024-01-02 00:00:00");
  EXPECT_DOUBLE_EQ(j["summary"]["final_cash"].get<double>(), 500.0);
  EXPECT_DOUBLE_EQ(j["summary"]["max_drawdown"].get<double>(), 0.25);
  EXPECT_EQ(j["stats"]["fills_applied"].get<std::size_t>(), 1u);
  EXPECT_EQ(j["snapshots"].size(), 4u);
  ASSERT_EQ(j["transactions"].size(), 1u);
  EXPECT_EQ(j["transactions"][0]["side"], "BUY");
  EXPECT_EQ(j["dividends"].size(), 1u);
}

TEST_F(BacktestReportTest, WritesJsonFile) {
  const auto path = std::filesystem::temp_directory_path() / "backtest_report_test.json";
  backtest::writeResultJson(result, path.string());

  std::ifstream in(path);
  ASSERT_TRUE(in.is_open());
  const auto j = nlohmann::json::parse(in);
  EXPECT_EQ(j["transactions"].size(), 1u);
  in.close();

  std::error_code ec;
  std::filesystem::remove(path, ec);

  EXPECT_THROW(backtest::writeResultJson(result, "/nonexistent-dir/results.json"),
               backtest::DataError);
}
