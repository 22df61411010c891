#include "backtest/execution/simulated_execution_handler.hpp"
#include "backtest/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <iostream>

namespace backtest {

double CommissionModel::commissionFor(double quantity, double price) const {
  return std::max(per_share * quantity + pct * quantity * price, minimum);
}

// -----------------------------------------------------------------------------
// Constructor: validate commission rates
// -----------------------------------------------------------------------------
SimulatedExecutionHandler::SimulatedExecutionHandler(CommissionModel commission)
    : commission_(commission) {
  for (const double rate : {commission_.per_share, commission_.pct, commission_.minimum}) {
    if (!std::isfinite(rate) || rate < 0.0) {
      throw ContractViolation("commission rates must be finite and non-negative");
    }
  }
}

// -----------------------------------------------------------------------------
// execute: immediate full fill at the reference price
// -----------------------------------------------------------------------------
std::optional<FillEvent> SimulatedExecutionHandler::execute(
    const OrderEvent& event, double reference_price) {
  const domain::Order& order = event.order;

  if (order.kind != domain::OrderKind::Market) {
    std::cerr << "[SimulatedExecutionHandler] Rejected order " << order.id
              << " (" << order.ticker << "): unsupported order kind "
              << domain::toString(order.kind) << "\n";
    return std::nullopt;
  }
  if (!std::isfinite(reference_price) || reference_price <= 0.0) {
    std::cerr << "[SimulatedExecutionHandler] Rejected order " << order.id
              << " (" << order.ticker << "): reference price "
              << reference_price << " is not a positive finite number\n";
    return std::nullopt;
  }
  if (!std::isfinite(order.quantity) || order.quantity <= 0.0) {
    std::cerr << "[SimulatedExecutionHandler] Rejected order " << order.id
              << " (" << order.ticker << "): quantity " << order.quantity
              << " is not a positive finite number\n";
    return std::nullopt;
  }

  FillEvent fill;
  fill.ticker = order.ticker;
  fill.side = order.side;
  fill.quantity_filled = order.quantity;
  fill.fill_price = reference_price;
  fill.commission = commission_.commissionFor(order.quantity, reference_price);
  fill.order_id = order.id;
  fill.timestamp = event.timestamp;
  return fill;
}

}  // namespace backtest
