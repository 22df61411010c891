#pragma once

#include "backtest/strategy/i_strategy.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// MovingAverageCrossStrategy
// -----------------------------------------------------------------------------
//
// @brief  Long-only simple-moving-average crossover.
//
// @details
// For each configured ticker the strategy keeps the last `slow_window`
// prices and computes two simple moving averages:
//
//   fast = mean of the last fast_window prices
//   slow = mean of the last slow_window prices
//
// Both become available once slow_window prices have been seen. A cross is
// detected by comparing the sign of (fast - slow) with the sign at the
// previous update:
//
//   upward cross   (<= 0 then > 0)  and flat  → BUY  `quantity`
//   downward cross (>= 0 then < 0)  and long  → SELL `quantity`
//
// The strategy tracks the position it intends to hold, not the portfolio's
// actual position. It never emits a SELL without a preceding BUY, so it
// cannot ask for a short.
//
// Signal strength is |fast - slow| / slow.
// -----------------------------------------------------------------------------
class MovingAverageCrossStrategy final : public IStrategy {
 public:
  struct Params {
    std::vector<std::string> tickers;
    std::size_t fast_window{10};
    std::size_t slow_window{30};
    double quantity{0.0};
  };

  // @throws ContractViolation if id or tickers is empty, a window is zero,
  //         fast_window >= slow_window, or quantity <= 0.
  MovingAverageCrossStrategy(std::string id, Params params);

  std::vector<SignalEvent> calculateSignals(
      const MarketUpdateEvent& event) override;

  std::vector<std::string> subscribedTickers() const override {
    return params_.tickers;
  }

  const std::string& id() const override { return id_; }

 private:
  struct TickerState {
    std::deque<double> prices;          // Last slow_window prices, oldest first
    std::optional<double> last_spread;  // fast - slow at the previous update
    bool long_position{false};
  };

  static double mean(const std::deque<double>& prices, std::size_t window);

  std::string id_;
  Params params_;
  std::map<std::string, TickerState> state_;
};

}  // namespace backtest
