#pragma once

#include "backtest/events/fill_event.hpp"
#include "backtest/events/order_event.hpp"

#include <optional>

namespace backtest {

// -----------------------------------------------------------------------------
// IExecutionHandler — abstract interface for execution policies
// -----------------------------------------------------------------------------
//
// @brief  Turns an order plus a reference price into a fill, or refuses it.
//
// @details
// The Backtester looks up the reference price from the data feed as of the
// order's timestamp and calls execute() synchronously from the drain loop.
// The handler never sees the queue or the portfolio; it returns the fill and
// the Backtester enqueues it.
//
// Implementations:
//   * SimulatedExecutionHandler — fills MARKET orders at the reference
//     price with a configurable commission model.
//
// Ownership:
//   Borrowed by reference by the Backtester for the duration of a run.
// -----------------------------------------------------------------------------
class IExecutionHandler {
 public:
  virtual ~IExecutionHandler() = default;

  // -------------------------------------------------------------------------
  // execute(order, reference_price)
  // -------------------------------------------------------------------------
  // @return The fill, or std::nullopt if the order is refused. Refusals are
  //         logged by the implementation.
  // -------------------------------------------------------------------------
  virtual std::optional<FillEvent> execute(const OrderEvent& order,
                                           double reference_price) = 0;
};

}  // namespace backtest
