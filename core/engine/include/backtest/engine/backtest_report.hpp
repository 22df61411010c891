#pragma once

#include "backtest/engine/backtester.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <ostream>
#include <string>

namespace backtest {

// -----------------------------------------------------------------------------
// PerformanceSummary
// -----------------------------------------------------------------------------
// Headline numbers derived from a BacktestResult.
//
//   total_return   (final_net_value - initial_cash) / initial_cash,
//                  0 when initial_cash is 0
//   max_drawdown   largest peak-to-trough fall of snapshot net values,
//                  as a non-negative fraction of the peak
// -----------------------------------------------------------------------------
struct PerformanceSummary {
  double initial_cash{0.0};
  double final_net_value{0.0};
  double total_return{0.0};
  double max_drawdown{0.0};
  double realized_pnl{0.0};
  double total_commission{0.0};
  double total_dividends{0.0};
  std::size_t trades{0};
  std::size_t snapshots{0};
};

PerformanceSummary summarize(const BacktestResult& result);

// Human-readable summary, one metric per line.
void printSummary(std::ostream& out, const PerformanceSummary& summary);

// -------------------------------------------------------------------------
// resultToJson / writeResultJson
// -------------------------------------------------------------------------
// Object with "settings", "summary", "stats", "snapshots", "transactions"
// and "dividends". writeResultJson() throws DataError if the file cannot be
// written.
// -------------------------------------------------------------------------
nlohmann::json resultToJson(const BacktestResult& result);

void writeResultJson(const BacktestResult& result, const std::string& path);

}  // namespace backtest
