#include "backtest/feed/csv_loader.hpp"
#include "backtest/core/errors.hpp"
#include "backtest/feed/historical_data_feed.hpp"
#include "backtest/time/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace backtest {

namespace {

std::string trimmed(const std::string& s) {
  auto begin = std::find_if_not(s.begin(), s.end(),
                                [](unsigned char c) { return std::isspace(c); });
  auto end = std::find_if_not(s.rbegin(), s.rend(),
                              [](unsigned char c) { return std::isspace(c); })
                 .base();
  return (begin < end) ? std::string(begin, end) : std::string();
}

std::string lowered(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::vector<std::string> splitRow(const std::string& line) {
  std::vector<std::string> fields;
  std::stringstream ss(line);
  std::string token;
  while (std::getline(ss, token, ',')) {
    fields.push_back(trimmed(token));
  }
  // getline drops a trailing empty field ("a,b,").
  if (!line.empty() && line.back() == ',') {
    fields.emplace_back();
  }
  return fields;
}

// -----------------------------------------------------------------------------
// CsvReader: header lookup plus line-numbered field access
// -----------------------------------------------------------------------------
class CsvReader {
 public:
  CsvReader(std::istream& in, std::string source)
      : in_(in), source_(std::move(source)) {
    std::string header;
    if (!std::getline(in_, header)) {
      throw DataError(source_ + ": empty file, expected a header row");
    }
    line_no_ = 1;
    const auto names = splitRow(stripCarriageReturn(header));
    for (std::size_t i = 0; i < names.size(); ++i) {
      columns_.emplace(lowered(names[i]), i);
    }
  }

  // Index of the first header that matches one of the names; -1 if absent.
  long find(std::initializer_list<const char*> names) const {
    for (const char* name : names) {
      auto it = columns_.find(name);
      if (it != columns_.end()) {
        return static_cast<long>(it->second);
      }
    }
    return -1;
  }

  std::size_t require(std::initializer_list<const char*> names) const {
    const long idx = find(names);
    if (idx < 0) {
      throw DataError(source_ + ": missing required column '" +
                      *names.begin() + "'");
    }
    return static_cast<std::size_t>(idx);
  }

  // Advances to the next non-blank row. Returns false at end of input.
  bool next() {
    std::string line;
    while (std::getline(in_, line)) {
      ++line_no_;
      line = stripCarriageReturn(line);
      if (trimmed(line).empty()) {
        continue;
      }
      row_ = splitRow(line);
      return true;
    }
    return false;
  }

  const std::string& field(std::size_t idx) const {
    if (idx >= row_.size()) {
      fail("expected at least " + std::to_string(idx + 1) + " fields, got " +
           std::to_string(row_.size()));
    }
    return row_[idx];
  }

  double number(std::size_t idx) const {
    const std::string& text = field(idx);
    try {
      std::size_t used = 0;
      const double value = std::stod(text, &used);
      if (used != text.size()) {
        fail("trailing characters in number '" + text + "'");
      }
      if (!std::isfinite(value)) {
        fail("not a finite number: '" + text + "'");
      }
      return value;
    } catch (const std::invalid_argument&) {
      fail("not a number: '" + text + "'");
    } catch (const std::out_of_range&) {
      fail("number out of range: '" + text + "'");
    }
  }

  double optionalNumber(long idx) const {
    if (idx < 0 || static_cast<std::size_t>(idx) >= row_.size() ||
        row_[static_cast<std::size_t>(idx)].empty()) {
      return 0.0;
    }
    return number(static_cast<std::size_t>(idx));
  }

  Timestamp timestamp(std::size_t idx) const {
    const std::string& text = field(idx);
    try {
      return parseTimestamp(text);
    } catch (const DataError&) {
      fail("invalid timestamp '" + text + "'");
    }
  }

  [[noreturn]] void fail(const std::string& what) const {
    throw DataError(source_ + ":" + std::to_string(line_no_) + ": " + what);
  }

 private:
  static std::string stripCarriageReturn(std::string line) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    return line;
  }

  std::istream& in_;
  std::string source_;
  std::size_t line_no_{0};
  std::map<std::string, std::size_t> columns_;
  std::vector<std::string> row_;
};

std::ifstream openOrThrow(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw DataError("cannot open file: " + path);
  }
  return file;
}

}  // namespace

// -----------------------------------------------------------------------------
// parsePriceCsv
// -----------------------------------------------------------------------------
std::vector<MarketUpdateEvent> parsePriceCsv(std::istream& in,
                                             const std::string& source_name) {
  CsvReader reader(in, source_name);
  const std::size_t ts_col = reader.require({"timestamp", "date"});
  const std::size_t ticker_col = reader.require({"ticker", "symbol"});
  const std::size_t close_col = reader.require({"close", "price"});
  const long open_col = reader.find({"open"});
  const long high_col = reader.find({"high"});
  const long low_col = reader.find({"low"});
  const long volume_col = reader.find({"volume"});

  std::vector<MarketUpdateEvent> bars;
  while (reader.next()) {
    MarketUpdateEvent bar;
    bar.timestamp = reader.timestamp(ts_col);
    bar.ticker = reader.field(ticker_col);
    if (bar.ticker.empty()) {
      reader.fail("empty ticker");
    }
    bar.price = reader.number(close_col);
    if (bar.price < 0.0) {
      reader.fail("negative price for " + bar.ticker);
    }
    bar.open = reader.optionalNumber(open_col);
    bar.high = reader.optionalNumber(high_col);
    bar.low = reader.optionalNumber(low_col);
    bar.volume = reader.optionalNumber(volume_col);
    bars.push_back(std::move(bar));
  }
  return bars;
}

// -----------------------------------------------------------------------------
// parseDividendCsv
// -----------------------------------------------------------------------------
std::vector<DividendEvent> parseDividendCsv(std::istream& in,
                                            const std::string& source_name) {
  CsvReader reader(in, source_name);
  const std::size_t ex_col = reader.require({"ex_date", "date"});
  const std::size_t ticker_col = reader.require({"ticker", "symbol"});
  const std::size_t amount_col = reader.require({"dividend_per_share", "dividend"});
  const long pay_col = reader.find({"payment_date"});

  std::vector<DividendEvent> dividends;
  while (reader.next()) {
    DividendEvent div;
    div.ex_date = reader.timestamp(ex_col);
    div.timestamp = div.ex_date;
    div.ticker = reader.field(ticker_col);
    if (div.ticker.empty()) {
      reader.fail("empty ticker");
    }
    div.dividend_per_share = reader.number(amount_col);
    if (div.dividend_per_share < 0.0) {
      reader.fail("negative dividend for " + div.ticker);
    }
    div.payment_date = div.ex_date;
    if (pay_col >= 0 && !reader.field(static_cast<std::size_t>(pay_col)).empty()) {
      div.payment_date = reader.timestamp(static_cast<std::size_t>(pay_col));
    }
    dividends.push_back(std::move(div));
  }
  return dividends;
}

std::vector<MarketUpdateEvent> loadPriceCsv(const std::string& path) {
  std::ifstream file = openOrThrow(path);
  return parsePriceCsv(file, path);
}

std::vector<DividendEvent> loadDividendCsv(const std::string& path) {
  std::ifstream file = openOrThrow(path);
  return parseDividendCsv(file, path);
}

std::size_t loadIntoFeed(HistoricalDataFeed& feed,
                         const std::string& prices_path,
                         const std::string& dividends_path) {
  std::size_t added = 0;
  for (auto& bar : loadPriceCsv(prices_path)) {
    feed.addBar(std::move(bar));
    ++added;
  }
  std::cout << "[CsvLoader] Loaded " << added << " bars from " << prices_path
            << "\n";

  if (!dividends_path.empty()) {
    std::size_t divs = 0;
    for (auto& div : loadDividendCsv(dividends_path)) {
      feed.addDividend(std::move(div));
      ++divs;
    }
    std::cout << "[CsvLoader] Loaded " << divs << " dividends from "
              << dividends_path << "\n";
    added += divs;
  }
  return added;
}

}  // namespace backtest
