#include "backtest/strategy/buy_and_hold_strategy.hpp"
#include "backtest/core/errors.hpp"
#include "backtest/time/time_utils.hpp"

#include <iostream>
#include <utility>

namespace backtest {

BuyAndHoldStrategy::BuyAndHoldStrategy(std::string id,
                                       std::map<std::string, double> targets)
    : id_(std::move(id)), targets_(std::move(targets)) {
  if (id_.empty()) {
    throw ContractViolation("strategy id must be non-empty");
  }
  if (targets_.empty()) {
    throw ContractViolation("buy-and-hold strategy " + id_ +
                            " needs at least one target ticker");
  }
  for (const auto& [ticker, quantity] : targets_) {
    if (ticker.empty() || quantity <= 0.0) {
      throw ContractViolation("buy-and-hold target '" + ticker +
                              "' needs a positive quantity");
    }
  }
}

// -----------------------------------------------------------------------------
// calculateSignals: one BUY per target, on first sight
// -----------------------------------------------------------------------------
std::vector<SignalEvent> BuyAndHoldStrategy::calculateSignals(
    const MarketUpdateEvent& event) {
  std::vector<SignalEvent> signals;

  auto it = targets_.find(event.ticker);
  if (it == targets_.end() || bought_.count(event.ticker) != 0) {
    return signals;
  }

  SignalEvent signal;
  signal.strategy_id = id_;
  signal.ticker = event.ticker;
  signal.side = domain::Side::Buy;
  signal.suggested_quantity = it->second;
  signal.strength = 1.0;
  signal.timestamp = event.timestamp;
  signals.push_back(std::move(signal));

  bought_.insert(event.ticker);

  std::cout << "[" << id_ << "] BUY signal " << it->second << " "
            << event.ticker << " at " << formatTimestamp(event.timestamp)
            << "\n";
  return signals;
}

std::vector<std::string> BuyAndHoldStrategy::subscribedTickers() const {
  std::vector<std::string> tickers;
  tickers.reserve(targets_.size());
  for (const auto& [ticker, quantity] : targets_) {
    tickers.push_back(ticker);
  }
  return tickers;
}

}  // namespace backtest
