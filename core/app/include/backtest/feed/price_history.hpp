#pragma once

#include "backtest/events/event_types.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// PriceHistory
// -----------------------------------------------------------------------------
// Responsibility: Per-ticker time series of observed prices, kept sorted by
// timestamp, answering as-of lookups for the feeds' latestPrice().
//
// When several prices share a timestamp the one recorded last wins.
// -----------------------------------------------------------------------------
class PriceHistory {
 public:
  void record(const std::string& ticker, Timestamp ts, double price);

  // Last price stamped at or before as_of.
  std::optional<double> latest(const std::string& ticker, Timestamp as_of) const;

  bool empty() const { return series_.empty(); }

 private:
  using Series = std::vector<std::pair<Timestamp, double>>;
  std::map<std::string, Series> series_;
};

}  // namespace backtest
