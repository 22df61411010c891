#pragma once

#include <string>

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// Holding — per-ticker position state
// -----------------------------------------------------------------------------
//
// @brief  Tracks the quantity owned, the weighted average entry cost and the
//         last known price (the "mark") of a single ticker.
//
// @details
// Long-only: quantity never goes below zero. Short selling is not modelled,
// so removing more shares than are held is rejected rather than flipping the
// position.
//
// average_cost is the quantity-weighted mean of all purchase prices since
// the position was last flat. It is unchanged by sales and resets to 0 when
// the quantity returns to 0; a later re-entry starts a fresh cost basis.
//
// market_value() is always computed from quantity and last_price, so it can
// never drift from the fields it is derived from.
//
// Ownership:
//   Owned by Portfolio, keyed by ticker. Copies appear only in snapshots.
// -----------------------------------------------------------------------------
class Holding {
 public:
  // Quantities within this distance of each other compare equal. Fractional
  // buys and sells accumulate binary rounding error (0.3 - 0.1 - 0.1 leaves
  // 0.09999999999999998).
  static constexpr double kQuantityTolerance = 1e-9;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  ticker  Non-empty instrument identifier.
  // @throws ContractViolation if ticker is empty.
  // -------------------------------------------------------------------------
  explicit Holding(std::string ticker);

  const std::string& ticker() const { return ticker_; }
  double quantity() const { return quantity_; }
  double averageCost() const { return average_cost_; }
  double lastPrice() const { return last_price_; }
  double marketValue() const { return quantity_ * last_price_; }

  // True if qty shares can be removed, allowing for rounding residue.
  bool covers(double qty) const;

  // -------------------------------------------------------------------------
  // updatePrice(price)
  // -------------------------------------------------------------------------
  // @brief  Re-marks the holding at a new market price.
  // @throws ContractViolation if price is negative or not finite.
  // -------------------------------------------------------------------------
  void updatePrice(double price);

  // -------------------------------------------------------------------------
  // addShares(qty, price)
  // -------------------------------------------------------------------------
  // @brief  Buys qty shares at price.
  //
  // @details
  //   new_avg = (old_avg * old_qty + price * qty) / (old_qty + qty)
  // The purchase price also becomes the new mark.
  //
  // @throws ContractViolation if qty <= 0, price < 0, or either is not
  //         finite. The holding is unchanged on failure.
  // -------------------------------------------------------------------------
  void addShares(double qty, double price);

  // -------------------------------------------------------------------------
  // removeShares(qty)
  // -------------------------------------------------------------------------
  // @brief  Sells qty shares out of the position.
  //
  // @return The cost basis removed, qty * average_cost, computed before the
  //         average cost is reset. Callers use it for realized P&L.
  //
  // A remainder within kQuantityTolerance of zero is treated as flat: the
  // quantity snaps to 0 and the average cost resets.
  //
  // @throws ContractViolation          if qty <= 0 or not finite.
  //         InsufficientPositionError  if qty exceeds the held quantity.
  //         The holding is unchanged on failure.
  // -------------------------------------------------------------------------
  double removeShares(double qty);

 private:
  std::string ticker_;
  double quantity_{0.0};
  double average_cost_{0.0};
  double last_price_{0.0};
};

}  // namespace domain
}  // namespace backtest
