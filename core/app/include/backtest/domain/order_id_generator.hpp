#pragma once

#include "backtest/domain/order.hpp"

namespace backtest {

// -----------------------------------------------------------------------------
// OrderIdGenerator — monotonically increasing order ID source
// -----------------------------------------------------------------------------
//
// @brief  Produces unique, monotonically increasing order ids. The first id
//         is 1; 0 is reserved as "unset".
//
// @details
// The Backtester owns one generator per run and stamps every order it
// synthesizes from a signal. Fills echo the id back so the ledger can link a
// transaction to the order that caused it. Ids restart at 1 for every run,
// so ledgers are reproducible across runs in the same process.
//
// Thread model:
//   Called only from the simulation loop; not synchronized.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;

  // Non-copyable, non-movable: copying a generator would create two sources
  // producing duplicate ids.
  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  domain::OrderId next_id() { return next_id_++; }

 private:
  domain::OrderId next_id_{1};
};

}  // namespace backtest
