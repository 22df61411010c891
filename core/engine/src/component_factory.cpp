#include "backtest/engine/component_factory.hpp"
#include "backtest/core/errors.hpp"
#include "backtest/execution/simulated_execution_handler.hpp"
#include "backtest/feed/csv_loader.hpp"
#include "backtest/feed/historical_data_feed.hpp"
#include "backtest/feed/zmq_data_feed.hpp"
#include "backtest/strategy/buy_and_hold_strategy.hpp"
#include "backtest/strategy/moving_average_cross_strategy.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace backtest {

namespace {

std::unique_ptr<IStrategy> makeBuyAndHold(const StrategyConfig& config) {
  const auto& params = config.params;
  std::map<std::string, double> targets;

  if (params.contains("targets")) {
    targets = params.at("targets").get<std::map<std::string, double>>();
  } else if (params.contains("tickers")) {
    const double quantity = params.at("quantity").get<double>();
    for (const auto& ticker : params.at("tickers").get<std::vector<std::string>>()) {
      targets[ticker] = quantity;
    }
  } else {
    throw ConfigError("buy_and_hold needs 'params.targets' or 'params.tickers'");
  }
  return std::make_unique<BuyAndHoldStrategy>(config.id, std::move(targets));
}

std::unique_ptr<IStrategy> makeMovingAverageCross(const StrategyConfig& config) {
  const auto& params = config.params;
  MovingAverageCrossStrategy::Params p;
  p.tickers = params.at("tickers").get<std::vector<std::string>>();
  p.fast_window = params.value("fast_window", p.fast_window);
  p.slow_window = params.value("slow_window", p.slow_window);
  p.quantity = params.at("quantity").get<double>();
  return std::make_unique<MovingAverageCrossStrategy>(config.id, std::move(p));
}

}  // namespace

// -----------------------------------------------------------------------------
// makeDataFeed
// -----------------------------------------------------------------------------
std::unique_ptr<IDataFeed> makeDataFeed(const DataConfig& config) {
  switch (config.source) {
    case DataConfig::Source::Csv: {
      auto feed = std::make_unique<HistoricalDataFeed>();
      loadIntoFeed(*feed, config.prices_path, config.dividends_path);
      return feed;
    }
    case DataConfig::Source::Zmq:
      return std::make_unique<ZmqDataFeed>(config.endpoint, config.idle_timeout);
  }
  throw ConfigError("unsupported data source");
}

// -----------------------------------------------------------------------------
// makeStrategy
// -----------------------------------------------------------------------------
std::unique_ptr<IStrategy> makeStrategy(const StrategyConfig& config) {
  try {
    if (config.type == "buy_and_hold") {
      return makeBuyAndHold(config);
    }
    if (config.type == "moving_average_cross") {
      return makeMovingAverageCross(config);
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("strategy '" + config.id + "' params: " + e.what());
  } catch (const ContractViolation& e) {
    throw ConfigError("strategy '" + config.id + "': " + e.what());
  }
  throw ConfigError("unknown strategy type '" + config.type +
                    "' (expected buy_and_hold or moving_average_cross)");
}

std::unique_ptr<IExecutionHandler> makeExecutionHandler(
    const ExecutionConfig& config) {
  CommissionModel commission;
  commission.per_share = config.commission_per_share;
  commission.pct = config.pct_commission;
  commission.minimum = config.min_commission;
  try {
    return std::make_unique<SimulatedExecutionHandler>(commission);
  } catch (const ContractViolation& e) {
    throw ConfigError(e.what());
  }
}

BacktestSettings makeSettings(const BacktestConfig& config) {
  BacktestSettings settings;
  settings.start = config.start;
  settings.end = config.end;
  settings.initial_cash = config.initial_cash;
  settings.benchmark = config.benchmark;
  return settings;
}

}  // namespace backtest
