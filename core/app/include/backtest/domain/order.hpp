#pragma once

#include <cstdint>
#include <string>

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Responsibility: Identifies an order for the lifetime of one backtest run.
// Ids are issued by OrderIdGenerator starting at 1; 0 means "unset".
// A plain alias keeps it cheap to copy and hashable while making signatures
// self-documenting.
// -----------------------------------------------------------------------------
using OrderId = std::uint64_t;

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Responsibility: Trading direction shared by signals, orders, fills and
// ledger transactions. Scoped enum so BUY/SELL never convert silently to int.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// OrderKind
// -----------------------------------------------------------------------------
// Responsibility: How an order wants to be executed. The simulated execution
// handler only executes Market orders; Limit orders are representable so that
// strategies and feeds can express them, but they are rejected at execution.
// -----------------------------------------------------------------------------
enum class OrderKind {
  Market,
  Limit,
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: The intent to trade a quantity of one ticker.
//
// @details
// Orders are synthesized by the Backtester from accepted signals and travel
// through the event queue wrapped in an OrderEvent. They are plain data with
// value semantics; once enqueued nobody mutates them.
//
// limit_price is only meaningful for OrderKind::Limit.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};                        // Unique id within the run
  std::string strategy_id;             // Which strategy produced the signal
  std::string ticker;                  // Instrument to trade (e.g. "AAPL")
  Side side{Side::Buy};                // Buy or Sell
  double quantity{0.0};                // Units to trade, must be > 0
  OrderKind kind{OrderKind::Market};   // Market or Limit
  double limit_price{0.0};             // Limit orders only
};

// -----------------------------------------------------------------------------
// toString helpers
// -----------------------------------------------------------------------------
// Upper-case names match the ledger/JSON wire format ("BUY", "MARKET").
// -----------------------------------------------------------------------------
inline const char* toString(Side side) {
  switch (side) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

inline const char* toString(OrderKind kind) {
  switch (kind) {
    case OrderKind::Market: return "MARKET";
    case OrderKind::Limit:  return "LIMIT";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace backtest
