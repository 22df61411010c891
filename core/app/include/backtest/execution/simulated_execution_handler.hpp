#pragma once

#include "backtest/execution/i_execution_handler.hpp"

namespace backtest {

// -----------------------------------------------------------------------------
// CommissionModel
// -----------------------------------------------------------------------------
// commission = max(per_share * qty + pct * qty * price, minimum)
// All rates must be >= 0.
// -----------------------------------------------------------------------------
struct CommissionModel {
  double per_share{0.0};
  double pct{0.0};
  double minimum{0.0};

  double commissionFor(double quantity, double price) const;
};

// -----------------------------------------------------------------------------
// SimulatedExecutionHandler — deterministic fill simulator for backtesting
// -----------------------------------------------------------------------------
//
// @brief  Fills MARKET orders in full at the reference price and charges a
//         commission from its CommissionModel.
//
// @details
// Fill model:
//   - Immediate fill: every accepted order is filled in one step.
//   - Fill price:     the reference price supplied by the Backtester.
//   - Zero slippage:  no market impact or latency.
//
// The fill carries the order's timestamp and id so that the ledger can link
// each transaction back to its order and so results do not depend on wall
// clock time.
//
// Refusals (logged to std::cerr, no fill):
//   - order kind other than MARKET
//   - reference_price <= 0
//   - quantity <= 0
//
// Thread model:
//   Stateless apart from the commission model; called from the simulation
//   loop only.
// -----------------------------------------------------------------------------
class SimulatedExecutionHandler final : public IExecutionHandler {
 public:
  // @throws ContractViolation if any commission rate is negative.
  explicit SimulatedExecutionHandler(CommissionModel commission = {});

  std::optional<FillEvent> execute(const OrderEvent& order,
                                   double reference_price) override;

  const CommissionModel& commissionModel() const { return commission_; }

 private:
  CommissionModel commission_;
};

}  // namespace backtest
