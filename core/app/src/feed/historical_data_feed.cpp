#include "backtest/feed/historical_data_feed.hpp"
#include "backtest/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace backtest {

void HistoricalDataFeed::addBar(MarketUpdateEvent bar) {
  if (started_) {
    throw ContractViolation("cannot add bars after streaming has started");
  }
  if (bar.ticker.empty()) {
    throw ContractViolation("bar ticker must be non-empty");
  }
  if (!std::isfinite(bar.price) || bar.price < 0.0) {
    throw ContractViolation("bar price for " + bar.ticker +
                            " must be finite and non-negative, got " +
                            std::to_string(bar.price));
  }
  prices_.record(bar.ticker, bar.timestamp, bar.price);
  timeline_.emplace_back(std::move(bar));
}

void HistoricalDataFeed::addDividend(DividendEvent dividend) {
  if (started_) {
    throw ContractViolation("cannot add dividends after streaming has started");
  }
  if (dividend.ticker.empty()) {
    throw ContractViolation("dividend ticker must be non-empty");
  }
  if (!std::isfinite(dividend.dividend_per_share) || dividend.dividend_per_share < 0.0) {
    throw ContractViolation("dividend per share for " + dividend.ticker +
                            " must be finite and non-negative");
  }
  timeline_.emplace_back(std::move(dividend));
}

// -----------------------------------------------------------------------------
// prepare(): order the timeline once, before the first batch
// -----------------------------------------------------------------------------
void HistoricalDataFeed::prepare() {
  std::stable_sort(timeline_.begin(), timeline_.end(),
                   [](const Event& a, const Event& b) {
                     return eventTimestamp(a) < eventTimestamp(b);
                   });
  started_ = true;
}

bool HistoricalDataFeed::wanted(const Event& event) const {
  return subscribed_.empty() || subscribed_.count(eventTicker(event)) != 0;
}

// -----------------------------------------------------------------------------
// streamNext(): all wanted events sharing the next timestamp
// -----------------------------------------------------------------------------
std::vector<Event> HistoricalDataFeed::streamNext() {
  if (!started_) {
    prepare();
  }

  std::vector<Event> batch;

  while (cursor_ < timeline_.size() && !wanted(timeline_[cursor_])) {
    ++cursor_;
  }
  if (cursor_ >= timeline_.size()) {
    return batch;
  }

  const Timestamp step = eventTimestamp(timeline_[cursor_]);
  while (cursor_ < timeline_.size() &&
         eventTimestamp(timeline_[cursor_]) == step) {
    if (wanted(timeline_[cursor_])) {
      batch.push_back(timeline_[cursor_]);
    }
    ++cursor_;
  }
  return batch;
}

std::optional<double> HistoricalDataFeed::latestPrice(const std::string& ticker,
                                                      Timestamp as_of) const {
  return prices_.latest(ticker, as_of);
}

void HistoricalDataFeed::subscribe(const std::vector<std::string>& tickers) {
  subscribed_.insert(tickers.begin(), tickers.end());
}

}  // namespace backtest
