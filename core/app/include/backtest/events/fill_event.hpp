#pragma once

#include "backtest/domain/order.hpp"
#include "backtest/events/event_types.hpp"

#include <optional>
#include <string>

namespace backtest {

// -----------------------------------------------------------------------------
// FillEvent
// -----------------------------------------------------------------------------
//
// @brief  Immutable confirmation that an order executed at a specific price,
//         quantity and commission.
//
// @details
// Orders describe *intent*; fills describe *outcome*. The execution handler
// produces at most one fill per order (no partial fills in the simulated
// model). The Backtester converts each fill into a domain::Transaction and
// applies it to the portfolio.
//
// Unlike a bare execution report, a fill is self-describing: it carries the
// ticker and side so the portfolio never needs to look the order up.
// order_id links back to the order when the fill came from one.
// -----------------------------------------------------------------------------
struct FillEvent {
  std::string ticker;
  domain::Side side{domain::Side::Buy};
  double quantity_filled{0.0};  // Must be > 0
  double fill_price{0.0};       // Must be >= 0
  double commission{0.0};       // Must be >= 0
  std::optional<domain::OrderId> order_id;
  Timestamp timestamp{};
};

}  // namespace backtest
