#pragma once

#include "backtest/domain/transaction.hpp"
#include "backtest/events/event.hpp"
#include "backtest/portfolio/snapshot.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// JSON codec for feed messages and run results
// -----------------------------------------------------------------------------
//
// @brief  Converts between engine types and the JSON used on the ZeroMQ feed
//         and in the results file.
//
// @details
// Feed wire format. A message is one JSON object or an array of objects:
//
//   {
//     "type":         "market",          // "market" (default), "dividend",
//                                        // or "end_of_stream"
//     "timestamp_ms": 1704153600000,     // epoch ms; or "timestamp": text
//     "symbol":       "AAPL",            // alias: "ticker"
//     "price":        150.25,            // market: mark price (alias "close")
//     "open": 149.0, "high": 151.0,      // market: optional
//     "low": 148.5,  "volume": 1200.0,
//     "dividend_per_share": 0.24,        // dividend: required
//     "payment_date_ms": 1705000000000   // dividend: optional
//   }
//
// Text timestamps use the formats accepted by parseTimestamp(). A dividend's
// timestamp is its ex-date.
//
// Result format. Timestamps are written as "YYYY-MM-DD HH:MM:SS" text plus
// epoch milliseconds so the file is both readable and easy to re-load.
// -----------------------------------------------------------------------------

// Result of decoding one feed message.
struct FeedMessage {
  std::vector<Event> events;   // MarketUpdate and Dividend only
  bool end_of_stream{false};
};

// -------------------------------------------------------------------------
// decodeFeedMessage(payload)
// -------------------------------------------------------------------------
// @throws DataError if the payload is not valid JSON, a required field is
//         missing or has the wrong type, or the "type" is unknown.
// -------------------------------------------------------------------------
FeedMessage decodeFeedMessage(const std::string& payload);

// -------------------------------------------------------------------------
// encodeFeedEvent(event)
// -------------------------------------------------------------------------
// @brief  Inverse of decodeFeedMessage for a single event.
// @throws ContractViolation for event kinds that never travel on the feed.
// -------------------------------------------------------------------------
nlohmann::json encodeFeedEvent(const Event& event);

nlohmann::json transactionToJson(const domain::Transaction& tx);
nlohmann::json snapshotToJson(const Snapshot& snapshot);
nlohmann::json dividendRecordToJson(const DividendRecord& record);

}  // namespace backtest
