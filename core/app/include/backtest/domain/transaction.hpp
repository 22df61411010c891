#pragma once

#include "backtest/domain/order.hpp"
#include "backtest/events/event_types.hpp"

#include <optional>
#include <string>

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// Transaction
// -----------------------------------------------------------------------------
// Responsibility: One executed trade as recorded in the portfolio ledger.
//
// @details
// Built by the Backtester from a FillEvent and handed to
// Portfolio::applyTransaction(). Once appended to the ledger it is never
// mutated or removed, so the ledger is a faithful audit trail of every trade
// the run made.
//
// Invariants (checked by Portfolio): quantity > 0, price >= 0,
// commission >= 0.
// -----------------------------------------------------------------------------
struct Transaction {
  Timestamp timestamp{};
  std::string ticker;
  Side side{Side::Buy};
  double quantity{0.0};
  double price{0.0};
  double commission{0.0};
  std::optional<OrderId> order_id;  // Order that produced the fill, if any

  // quantity * price, before commission.
  double grossValue() const { return quantity * price; }
};

}  // namespace domain
}  // namespace backtest
