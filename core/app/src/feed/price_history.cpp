#include "backtest/feed/price_history.hpp"

#include <algorithm>
#include <iterator>

namespace backtest {

namespace {

bool timestampLess(const Timestamp& ts, const std::pair<Timestamp, double>& entry) {
  return ts < entry.first;
}

}  // namespace

void PriceHistory::record(const std::string& ticker, Timestamp ts, double price) {
  Series& series = series_[ticker];
  // Feeds almost always record in time order; only out-of-order inserts pay
  // for the search.
  if (series.empty() || series.back().first <= ts) {
    series.emplace_back(ts, price);
    return;
  }
  auto pos = std::upper_bound(series.begin(), series.end(), ts, timestampLess);
  series.insert(pos, std::make_pair(ts, price));
}

std::optional<double> PriceHistory::latest(const std::string& ticker,
                                           Timestamp as_of) const {
  auto it = series_.find(ticker);
  if (it == series_.end()) {
    return std::nullopt;
  }
  const Series& series = it->second;
  auto pos = std::upper_bound(series.begin(), series.end(), as_of, timestampLess);
  if (pos == series.begin()) {
    return std::nullopt;
  }
  return std::prev(pos)->second;
}

}  // namespace backtest
