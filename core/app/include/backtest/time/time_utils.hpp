#pragma once

#include "backtest/events/event_types.hpp"

#include <chrono>
#include <cstdint>
#include <ratio>
#include <string>

namespace backtest {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions that convert between Timestamp, epoch milliseconds,
//         calendar days and the text formats used by CSV, JSON and logs.
//
// @details
// All calendar arithmetic is done in UTC. A "day number" is the count of
// whole days since 1970-01-01; two timestamps fall on the same calendar date
// exactly when their day numbers are equal. The Backtester uses day numbers
// to record at most one snapshot per date.
//
// Thread-safety: Stateless; safe to call from any thread.
// -----------------------------------------------------------------------------

using Days = std::chrono::duration<std::int64_t, std::ratio<86400>>;
using DayNumber = std::int64_t;

// -------------------------------------------------------------------------
// ms_to_timestamp / timestamp_to_ms
// -------------------------------------------------------------------------
// Inverse conversions between Timestamp and milliseconds since the epoch.
// Sub-millisecond precision is truncated by timestamp_to_ms().
// -------------------------------------------------------------------------
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::duration_cast<Timestamp::duration>(
      std::chrono::milliseconds{ms})};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// dayNumber
// -------------------------------------------------------------------------
// @brief  Calendar day (UTC) of a timestamp as days since 1970-01-01.
//
// @details
// std::chrono::floor rounds toward negative infinity, so timestamps before
// the epoch still land on the correct day.
// -------------------------------------------------------------------------
inline DayNumber dayNumber(Timestamp tp) {
  return std::chrono::floor<Days>(tp.time_since_epoch()).count();
}

// Midnight UTC at the start of the given day.
inline Timestamp startOfDay(DayNumber day) {
  return Timestamp{std::chrono::duration_cast<Timestamp::duration>(Days{day})};
}

// Last representable millisecond of the given day.
inline Timestamp endOfDay(DayNumber day) {
  return startOfDay(day + 1) - std::chrono::milliseconds{1};
}

// -------------------------------------------------------------------------
// makeTimestamp
// -------------------------------------------------------------------------
// @brief  Builds a UTC timestamp from civil date and time fields.
//
// @param  month   1..12
// @param  day     1..31
// -------------------------------------------------------------------------
Timestamp makeTimestamp(int year, unsigned month, unsigned day,
                        int hour = 0, int minute = 0, int second = 0);

// -------------------------------------------------------------------------
// parseTimestamp
// -------------------------------------------------------------------------
// @brief  Parses "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" or
//         "YYYY-MM-DDTHH:MM:SS" (UTC).
//
// @param  text           The string to parse. Surrounding whitespace is
//                        ignored.
// @param  is_date_only   Optional out-parameter; set to true when the input
//                        had no time-of-day part.
//
// @throws DataError on any malformed input or out-of-range field.
// -------------------------------------------------------------------------
Timestamp parseTimestamp(const std::string& text, bool* is_date_only = nullptr);

// "YYYY-MM-DD HH:MM:SS" in UTC. Milliseconds are dropped.
std::string formatTimestamp(Timestamp tp);

// "YYYY-MM-DD" in UTC.
std::string formatDate(Timestamp tp);

}  // namespace backtest
