#pragma once

#include "backtest/events/event.hpp"

#include <optional>
#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// IDataFeed — abstract source of market data for a backtest
// -----------------------------------------------------------------------------
//
// @brief  Produces chronologically ordered MarketUpdate and Dividend events
//         and answers "what was the price of X as of time T" queries.
//
// @details
// The Backtester calls streamNext() once per loop iteration. Each batch
// holds the events for one time step (typically one bar across all
// subscribed tickers). An empty batch means the feed has nothing more to
// give; the run stops once the event queue is also empty.
//
// Contract for implementations:
//   - Batches only contain MarketUpdateEvent and DividendEvent.
//   - Timestamps are non-decreasing within and across batches. The
//     Backtester logs and skips any event that regresses.
//   - latestPrice() never looks ahead: it only reports prices stamped at or
//     before `as_of`.
//
// Implementations:
//   * HistoricalDataFeed — in-memory timeline, usually loaded from CSV.
//   * ZmqDataFeed        — live-replay over a ZeroMQ SUB socket.
// -----------------------------------------------------------------------------
class IDataFeed {
 public:
  virtual ~IDataFeed() = default;

  // Next batch of events, or an empty vector when exhausted.
  virtual std::vector<Event> streamNext() = 0;

  // -------------------------------------------------------------------------
  // latestPrice(ticker, as_of)
  // -------------------------------------------------------------------------
  // @return The most recent price for ticker stamped at or before as_of, or
  //         std::nullopt if none is known.
  // -------------------------------------------------------------------------
  virtual std::optional<double> latestPrice(const std::string& ticker,
                                            Timestamp as_of) const = 0;

  // Subscription hint. Implementations may ignore it.
  virtual void subscribe(const std::vector<std::string>& tickers) = 0;
};

}  // namespace backtest
