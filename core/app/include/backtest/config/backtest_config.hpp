#pragma once

#include "backtest/events/event_types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace backtest {

// -----------------------------------------------------------------------------
// BacktestConfig — everything needed to set up one run
// -----------------------------------------------------------------------------
//
// @brief  Plain data parsed from a JSON configuration file.
//
// @details
// Example:
//
//   {
//     "start": "2024-01-02",
//     "end": "2024-03-28",
//     "initial_cash": 100000.0,
//     "benchmark": "SPY",
//     "data": {
//       "source": "csv",
//       "prices": "data/sample_prices.csv",
//       "dividends": "data/sample_dividends.csv"
//     },
//     "strategy": {
//       "type": "buy_and_hold",
//       "id": "bh_aapl",
//       "params": { "targets": { "AAPL": 100 } }
//     },
//     "execution": {
//       "commission_per_share": 0.005,
//       "pct_commission": 0.0,
//       "min_commission": 1.0
//     },
//     "output": "results.json"
//   }
//
// A date-only "end" is the last millisecond of that day, so every bar
// stamped on the end date is processed. A date-only "start" is midnight.
//
// Relative file paths under "data" and "output" are resolved against the
// directory holding the configuration file.
// -----------------------------------------------------------------------------

struct DataConfig {
  enum class Source { Csv, Zmq };

  Source source{Source::Csv};

  // Csv
  std::string prices_path;
  std::string dividends_path;  // Empty when absent

  // Zmq
  std::string endpoint{"tcp://127.0.0.1:5555"};
  std::chrono::milliseconds idle_timeout{5000};
};

struct StrategyConfig {
  std::string type;   // "buy_and_hold" or "moving_average_cross"
  std::string id;
  nlohmann::json params = nlohmann::json::object();
};

struct ExecutionConfig {
  double commission_per_share{0.0};
  double pct_commission{0.0};
  double min_commission{0.0};
};

struct BacktestConfig {
  Timestamp start{};
  Timestamp end{};
  double initial_cash{0.0};
  std::optional<std::string> benchmark;
  DataConfig data;
  StrategyConfig strategy;
  ExecutionConfig execution;
  std::optional<std::string> output_path;
};

// -------------------------------------------------------------------------
// parseConfig(json, base_dir)
// -------------------------------------------------------------------------
// @param  base_dir  Directory that relative paths are resolved against.
//                   Empty leaves them as written.
// @throws ConfigError on missing or invalid values, naming the key.
// -------------------------------------------------------------------------
BacktestConfig parseConfig(const nlohmann::json& json,
                           const std::string& base_dir = "");

// -------------------------------------------------------------------------
// loadConfig(path)
// -------------------------------------------------------------------------
// @throws ConfigError if the file cannot be read, is not valid JSON, or
//         fails parseConfig().
// -------------------------------------------------------------------------
BacktestConfig loadConfig(const std::string& path);

}  // namespace backtest
