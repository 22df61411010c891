#include "backtest/time/time_utils.hpp"
#include "backtest/core/errors.hpp"

#include <cstdio>

namespace backtest {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian civil date (H. Hinnant's
// days_from_civil). Valid for every year representable by int.
DayNumber daysFromCivil(int y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return static_cast<DayNumber>(era) * 146097 + static_cast<DayNumber>(doe) -
         719468;
}

struct CivilDate {
  int year;
  unsigned month;
  unsigned day;
};

// Inverse of daysFromCivil.
CivilDate civilFromDays(DayNumber z) {
  z += 719468;
  const DayNumber era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const DayNumber y = static_cast<DayNumber>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return CivilDate{static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d};
}

bool isLeapYear(int y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned daysInMonth(int y, unsigned m) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30,
                                       31, 31, 30, 31, 30, 31};
  return (m == 2 && isLeapYear(y)) ? 29 : kDays[m - 1];
}

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

}  // namespace

// -----------------------------------------------------------------------------
// makeTimestamp()
// -----------------------------------------------------------------------------
Timestamp makeTimestamp(int year, unsigned month, unsigned day, int hour,
                        int minute, int second) {
  const auto since_midnight = std::chrono::hours{hour} +
                              std::chrono::minutes{minute} +
                              std::chrono::seconds{second};
  return startOfDay(daysFromCivil(year, month, day)) +
         std::chrono::duration_cast<Timestamp::duration>(since_midnight);
}

// -----------------------------------------------------------------------------
// parseTimestamp()
// -----------------------------------------------------------------------------
Timestamp parseTimestamp(const std::string& text, bool* is_date_only) {
  const std::string s = trim(text);

  int year = 0;
  unsigned month = 0;
  unsigned day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  char sep = 0;
  int consumed = 0;

  // %n records how many characters were matched so trailing garbage is
  // rejected instead of silently ignored.
  bool date_only = false;
  if (std::sscanf(s.c_str(), "%4d-%2u-%2u%c%2d:%2d:%2d%n", &year, &month, &day,
                  &sep, &hour, &minute, &second, &consumed) == 7 &&
      (sep == ' ' || sep == 'T') &&
      static_cast<std::size_t>(consumed) == s.size()) {
    date_only = false;
  } else if (std::sscanf(s.c_str(), "%4d-%2u-%2u%n", &year, &month, &day,
                         &consumed) == 3 &&
             static_cast<std::size_t>(consumed) == s.size()) {
    date_only = true;
    hour = minute = second = 0;
  } else {
    throw DataError("cannot parse timestamp '" + text + "'");
  }

  if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month) ||
      hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 ||
      second > 59) {
    throw DataError("timestamp out of range '" + text + "'");
  }

  if (is_date_only != nullptr) {
    *is_date_only = date_only;
  }
  return makeTimestamp(year, month, day, hour, minute, second);
}

// -----------------------------------------------------------------------------
// formatTimestamp() / formatDate()
// -----------------------------------------------------------------------------
std::string formatTimestamp(Timestamp tp) {
  const DayNumber day = dayNumber(tp);
  const CivilDate civil = civilFromDays(day);
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(
                        tp - startOfDay(day))
                        .count();

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02d:%02d:%02d", civil.year,
                civil.month, civil.day, static_cast<int>(secs / 3600),
                static_cast<int>((secs / 60) % 60), static_cast<int>(secs % 60));
  return buf;
}

std::string formatDate(Timestamp tp) {
  const CivilDate civil = civilFromDays(dayNumber(tp));
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", civil.year, civil.month,
                civil.day);
  return buf;
}

}  // namespace backtest
