#pragma once

#include "backtest/events/event_types.hpp"

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace backtest {

class HistoricalDataFeed;

// -----------------------------------------------------------------------------
// CSV loading
// -----------------------------------------------------------------------------
//
// @brief  Reads price bars and dividends from comma-separated files with a
//         header row.
//
// @details
// Columns are located by header name, so their order is free and unknown
// columns are ignored. Header names are matched case-insensitively.
//
// Price files:
//   required  timestamp (alias: date), ticker (alias: symbol),
//             close (alias: price)
//   optional  open, high, low, volume (default 0)
//
// Dividend files:
//   required  ex_date (alias: date), ticker (alias: symbol),
//             dividend_per_share (alias: dividend)
//   optional  payment_date (defaults to ex_date)
//
// Timestamps use the formats accepted by parseTimestamp(). Blank lines are
// skipped.
//
// Errors:
//   DataError naming the source and line number for an unreadable file, a
//   missing required column, a short row, or an unparseable field.
// -----------------------------------------------------------------------------

std::vector<MarketUpdateEvent> parsePriceCsv(std::istream& in,
                                             const std::string& source_name);

std::vector<DividendEvent> parseDividendCsv(std::istream& in,
                                            const std::string& source_name);

std::vector<MarketUpdateEvent> loadPriceCsv(const std::string& path);

std::vector<DividendEvent> loadDividendCsv(const std::string& path);

// -------------------------------------------------------------------------
// loadIntoFeed
// -------------------------------------------------------------------------
// @brief  Loads a price file and an optional dividend file (empty path to
//         skip) into feed.
// @return Number of events added.
// -------------------------------------------------------------------------
std::size_t loadIntoFeed(HistoricalDataFeed& feed,
                         const std::string& prices_path,
                         const std::string& dividends_path);

}  // namespace backtest
