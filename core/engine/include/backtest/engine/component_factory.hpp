#pragma once

#include "backtest/config/backtest_config.hpp"
#include "backtest/engine/backtester.hpp"
#include "backtest/execution/i_execution_handler.hpp"
#include "backtest/feed/i_data_feed.hpp"
#include "backtest/strategy/i_strategy.hpp"

#include <memory>

namespace backtest {

// -----------------------------------------------------------------------------
// Component factory
// -----------------------------------------------------------------------------
//
// @brief  Turns a BacktestConfig into the concrete collaborators of a run.
//
// @details
// Strategy types and their "params":
//
//   buy_and_hold
//     "targets": { "AAPL": 100, "MSFT": 50 }        ticker → quantity
//     or "tickers": ["AAPL", "MSFT"] with "quantity": 100
//
//   moving_average_cross
//     "tickers": ["AAPL"], "fast_window": 10, "slow_window": 30,
//     "quantity": 100
//
// Data sources: "csv" loads a HistoricalDataFeed from the configured files;
// "zmq" connects a ZmqDataFeed.
//
// All functions throw ConfigError for invalid parameters and let DataError
// from loading files propagate.
// -----------------------------------------------------------------------------

std::unique_ptr<IDataFeed> makeDataFeed(const DataConfig& config);

std::unique_ptr<IStrategy> makeStrategy(const StrategyConfig& config);

std::unique_ptr<IExecutionHandler> makeExecutionHandler(
    const ExecutionConfig& config);

BacktestSettings makeSettings(const BacktestConfig& config);

}  // namespace backtest
