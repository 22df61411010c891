#pragma once

#include "backtest/feed/i_data_feed.hpp"
#include "backtest/feed/price_history.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// HistoricalDataFeed — in-memory replay of bars and dividends
// -----------------------------------------------------------------------------
//
// @brief  Holds a complete timeline of market updates and dividends and
//         replays it one timestamp at a time.
//
// @details
// Loading:
//   addBar() and addDividend() append in any order. On the first call to
//   streamNext() the timeline is stable-sorted by timestamp, so events that
//   share a timestamp keep their insertion order. Adding data after
//   streaming has started is a contract violation.
//
// Streaming:
//   Each streamNext() returns every remaining event stamped with the next
//   timestamp. When subscribe() has been called with a non-empty list, only
//   events for subscribed tickers are returned.
//
// Price lookup:
//   latestPrice() answers from every loaded bar regardless of subscription,
//   limited to bars at or before `as_of`.
//
// Thread model:
//   Single-threaded; used from the simulation loop only.
// -----------------------------------------------------------------------------
class HistoricalDataFeed final : public IDataFeed {
 public:
  HistoricalDataFeed() = default;

  HistoricalDataFeed(const HistoricalDataFeed&) = delete;
  HistoricalDataFeed& operator=(const HistoricalDataFeed&) = delete;

  // @throws ContractViolation on empty ticker, negative or non-finite price, or when
  //         streaming has already started.
  void addBar(MarketUpdateEvent bar);

  // @throws ContractViolation on empty ticker, negative or non-finite dividend, or when
  //         streaming has already started.
  void addDividend(DividendEvent dividend);

  std::vector<Event> streamNext() override;

  std::optional<double> latestPrice(const std::string& ticker,
                                    Timestamp as_of) const override;

  void subscribe(const std::vector<std::string>& tickers) override;

  std::size_t size() const { return timeline_.size(); }
  std::size_t remaining() const { return timeline_.size() - cursor_; }

 private:
  void prepare();
  bool wanted(const Event& event) const;

  std::vector<Event> timeline_;
  std::size_t cursor_{0};
  bool started_{false};

  PriceHistory prices_;
  std::set<std::string> subscribed_;
};

}  // namespace backtest
