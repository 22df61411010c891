#pragma once

#include "backtest/events/event_types.hpp"

#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// IStrategy — abstract interface for trading strategies
// -----------------------------------------------------------------------------
//
// @brief  Maps one market update to zero or more trading signals.
//
// @details
// A strategy never calls execution and never touches the portfolio. It only
// returns signals; the Backtester enqueues them and decides what becomes an
// order. The call is synchronous and must not block.
//
// Implementations:
//   * BuyAndHoldStrategy          — one-shot buy per ticker.
//   * MovingAverageCrossStrategy  — fast/slow SMA crossover, long-only.
//
// Ownership:
//   Borrowed by reference by the Backtester for the duration of a run.
// -----------------------------------------------------------------------------
class IStrategy {
 public:
  virtual ~IStrategy() = default;

  // -------------------------------------------------------------------------
  // calculateSignals(event)
  // -------------------------------------------------------------------------
  // @return Signals generated in response to this update, possibly empty.
  //         Every signal should carry the update's timestamp.
  // -------------------------------------------------------------------------
  virtual std::vector<SignalEvent> calculateSignals(
      const MarketUpdateEvent& event) = 0;

  // Tickers whose market data the strategy needs. Forwarded to the feed as
  // a subscription hint. An empty list means every ticker.
  virtual std::vector<std::string> subscribedTickers() const = 0;

  virtual const std::string& id() const = 0;
};

}  // namespace backtest
