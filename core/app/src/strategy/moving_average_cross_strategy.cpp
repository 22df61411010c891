#include "backtest/strategy/moving_average_cross_strategy.hpp"
#include "backtest/core/errors.hpp"
#include "backtest/time/time_utils.hpp"

#include <cmath>
#include <iostream>
#include <utility>

namespace backtest {

MovingAverageCrossStrategy::MovingAverageCrossStrategy(std::string id,
                                                       Params params)
    : id_(std::move(id)), params_(std::move(params)) {
  if (id_.empty()) {
    throw ContractViolation("strategy id must be non-empty");
  }
  if (params_.tickers.empty()) {
    throw ContractViolation("moving-average strategy " + id_ +
                            " needs at least one ticker");
  }
  if (params_.fast_window == 0 || params_.fast_window >= params_.slow_window) {
    throw ContractViolation("moving-average windows need 0 < fast < slow, got fast=" +
                            std::to_string(params_.fast_window) + " slow=" +
                            std::to_string(params_.slow_window));
  }
  if (params_.quantity <= 0.0) {
    throw ContractViolation("moving-average quantity must be positive");
  }
  for (const auto& ticker : params_.tickers) {
    state_.emplace(ticker, TickerState{});
  }
}

double MovingAverageCrossStrategy::mean(const std::deque<double>& prices,
                                        std::size_t window) {
  double sum = 0.0;
  for (auto it = prices.end() - static_cast<std::ptrdiff_t>(window);
       it != prices.end(); ++it) {
    sum += *it;
  }
  return sum / static_cast<double>(window);
}

// -----------------------------------------------------------------------------
// calculateSignals: update windows, detect a sign change of fast - slow
// -----------------------------------------------------------------------------
std::vector<SignalEvent> MovingAverageCrossStrategy::calculateSignals(
    const MarketUpdateEvent& event) {
  std::vector<SignalEvent> signals;

  auto it = state_.find(event.ticker);
  if (it == state_.end()) {
    return signals;
  }
  TickerState& st = it->second;

  st.prices.push_back(event.price);
  if (st.prices.size() > params_.slow_window) {
    st.prices.pop_front();
  }
  if (st.prices.size() < params_.slow_window) {
    return signals;
  }

  const double fast = mean(st.prices, params_.fast_window);
  const double slow = mean(st.prices, params_.slow_window);
  const double spread = fast - slow;

  const std::optional<double> previous = st.last_spread;
  st.last_spread = spread;
  if (!previous) {
    return signals;
  }

  const bool crossed_up = *previous <= 0.0 && spread > 0.0;
  const bool crossed_down = *previous >= 0.0 && spread < 0.0;

  std::optional<domain::Side> side;
  if (crossed_up && !st.long_position) {
    side = domain::Side::Buy;
    st.long_position = true;
  } else if (crossed_down && st.long_position) {
    side = domain::Side::Sell;
    st.long_position = false;
  }
  if (!side) {
    return signals;
  }

  SignalEvent signal;
  signal.strategy_id = id_;
  signal.ticker = event.ticker;
  signal.side = *side;
  signal.suggested_quantity = params_.quantity;
  signal.strength = (slow != 0.0) ? std::abs(spread) / slow : 0.0;
  signal.timestamp = event.timestamp;
  signals.push_back(std::move(signal));

  std::cout << "[" << id_ << "] " << domain::toString(*side) << " signal "
            << event.ticker << " fast=" << fast << " slow=" << slow << " at "
            << formatTimestamp(event.timestamp) << "\n";
  return signals;
}

}  // namespace backtest
