#pragma once

#include "backtest/strategy/i_strategy.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// BuyAndHoldStrategy
// -----------------------------------------------------------------------------
//
// @brief  Emits a single BUY signal per target ticker on the first market
//         update seen for that ticker, then stays silent.
//
// @details
// Targets are configured as ticker → quantity. Updates for tickers outside
// the target map are ignored. The "already bought" flag is set when the
// signal is emitted, not when it fills, so a rejected buy is not retried.
// -----------------------------------------------------------------------------
class BuyAndHoldStrategy final : public IStrategy {
 public:
  // @throws ContractViolation if id is empty, targets is empty, or any
  //         quantity is not positive.
  BuyAndHoldStrategy(std::string id, std::map<std::string, double> targets);

  std::vector<SignalEvent> calculateSignals(
      const MarketUpdateEvent& event) override;

  std::vector<std::string> subscribedTickers() const override;

  const std::string& id() const override { return id_; }

 private:
  std::string id_;
  std::map<std::string, double> targets_;
  std::set<std::string> bought_;
};

}  // namespace backtest
