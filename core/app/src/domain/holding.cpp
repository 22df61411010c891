#include "backtest/domain/holding.hpp"
#include "backtest/core/errors.hpp"

#include <cmath>
#include <utility>

namespace backtest {
namespace domain {

Holding::Holding(std::string ticker) : ticker_(std::move(ticker)) {
  if (ticker_.empty()) {
    throw ContractViolation("holding ticker must be non-empty");
  }
}

// -----------------------------------------------------------------------------
// updatePrice(): re-mark
// -----------------------------------------------------------------------------
void Holding::updatePrice(double price) {
  if (!std::isfinite(price) || price < 0.0) {
    throw ContractViolation("price for " + ticker_ + " must be finite and non-negative, got " +
                            std::to_string(price));
  }
  last_price_ = price;
}

// -----------------------------------------------------------------------------
// addShares(): weighted-average cost update
// -----------------------------------------------------------------------------
void Holding::addShares(double qty, double price) {
  if (!std::isfinite(qty) || qty <= 0.0) {
    throw ContractViolation("quantity to add for " + ticker_ +
                            " must be finite and positive, got " + std::to_string(qty));
  }
  if (!std::isfinite(price) || price < 0.0) {
    throw ContractViolation("purchase price for " + ticker_ +
                            " must be finite and non-negative, got " + std::to_string(price));
  }

  const double new_quantity = quantity_ + qty;
  average_cost_ = (average_cost_ * quantity_ + price * qty) / new_quantity;
  quantity_ = new_quantity;
  last_price_ = price;
}

bool Holding::covers(double qty) const {
  return qty <= quantity_ + kQuantityTolerance;
}

// -----------------------------------------------------------------------------
// removeShares(): reduce quantity, keep cost basis per share
// -----------------------------------------------------------------------------
double Holding::removeShares(double qty) {
  if (!std::isfinite(qty) || qty <= 0.0) {
    throw ContractViolation("quantity to remove for " + ticker_ +
                            " must be finite and positive, got " + std::to_string(qty));
  }
  if (!covers(qty)) {
    throw InsufficientPositionError("cannot remove " + std::to_string(qty) +
                                    " " + ticker_ + ", only " +
                                    std::to_string(quantity_) + " held");
  }

  const double cost_basis = qty * average_cost_;
  quantity_ -= qty;
  // Rounding residue from fractional sells closes the position.
  if (quantity_ <= kQuantityTolerance) {
    quantity_ = 0.0;
    average_cost_ = 0.0;
  }
  return cost_basis;
}

}  // namespace domain
}  // namespace backtest
