#pragma once

#include "backtest/domain/order.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace backtest {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Type alias for simulated time. Every event carries one; the Backtester uses
// it to order processing, advance the simulation clock and bucket snapshots
// into calendar days. system_clock::time_point is type-safe and maps directly
// onto epoch milliseconds for the JSON/ZeroMQ wire format (see time_utils).
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// MarketUpdateEvent
// -----------------------------------------------------------------------------
// Responsibility: One bar (or tick) of historical data for a single ticker.
// Why in architecture: The data feed produces these; the Backtester marks the
// portfolio with `price` and hands the event to the strategy.
//
// `price` is the value used for valuation (the close for a bar). The OHLCV
// fields are auxiliary and may be zero when the source does not carry them.
// -----------------------------------------------------------------------------
struct MarketUpdateEvent {
  std::string ticker;     // Instrument identifier (e.g. "AAPL")
  double price{0.0};      // Mark price (close of the bar)
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double volume{0.0};
  Timestamp timestamp{};  // When this bar closed
};

// -----------------------------------------------------------------------------
// SignalEvent
// -----------------------------------------------------------------------------
// Responsibility: A strategy's suggestion to trade. It is not yet an order:
// the Backtester rejects signals without a positive suggested_quantity and
// turns the rest into MARKET orders.
// -----------------------------------------------------------------------------
struct SignalEvent {
  std::string strategy_id;                 // Which strategy produced this
  std::string ticker;                      // Instrument to trade
  domain::Side side{domain::Side::Buy};
  std::optional<double> suggested_quantity;  // Units; required to trade
  std::optional<double> strength;            // Strategy-defined confidence
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// DividendEvent
// -----------------------------------------------------------------------------
// Responsibility: A cash dividend corporate action. `timestamp` is the ex-date
// used for ordering; payment_date is carried for reporting only.
// -----------------------------------------------------------------------------
struct DividendEvent {
  std::string ticker;
  double dividend_per_share{0.0};  // Cash per share, must be >= 0
  Timestamp ex_date{};
  Timestamp payment_date{};
  Timestamp timestamp{};
};

}  // namespace backtest
