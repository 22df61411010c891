#pragma once

#include "backtest/events/event_types.hpp"

#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// HoldingSnapshot
// -----------------------------------------------------------------------------
// Value copy of one Holding at snapshot time.
// -----------------------------------------------------------------------------
struct HoldingSnapshot {
  std::string ticker;
  double quantity{0.0};
  double average_cost{0.0};
  double last_price{0.0};
  double market_value{0.0};
};

// -----------------------------------------------------------------------------
// Snapshot
// -----------------------------------------------------------------------------
// Responsibility: Point-in-time valuation of the whole portfolio.
//
// The Backtester records at most one per calendar date; the sequence of
// snapshots is the equity curve of the run. `holdings` is ordered by ticker.
// net_value == cash + holdings_value at the instant of recording.
// -----------------------------------------------------------------------------
struct Snapshot {
  Timestamp timestamp{};
  double net_value{0.0};
  double cash{0.0};
  double holdings_value{0.0};
  std::vector<HoldingSnapshot> holdings;
};

// -----------------------------------------------------------------------------
// DividendRecord
// -----------------------------------------------------------------------------
// Responsibility: One dividend credit, kept in the portfolio's dividend
// ledger (never in the transaction ledger).
// amount == quantity_held * dividend_per_share.
// -----------------------------------------------------------------------------
struct DividendRecord {
  Timestamp timestamp{};
  std::string ticker;
  double quantity_held{0.0};
  double dividend_per_share{0.0};
  double amount{0.0};
};

}  // namespace backtest
