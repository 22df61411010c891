// -----------------------------------------------------------------------------
// backtester — single executable entry point.
//
// Usage:
//   backtester <config.json> [--output <results.json>]
//
//   1) Load the JSON run configuration.
//   2) Build the data feed, strategy and execution handler from it. A CSV
//      source is loaded into memory here; a ZeroMQ source connects to its
//      publisher and receives data as the run pulls it.
//   3) Run the Backtester to completion on the main thread.
//   4) Print the performance summary and, when an output path is given on
//      the command line or in the config, write the full result as JSON.
//
// Exit codes:
//   0  success
//   1  configuration, data or contract error
//   2  usage error
//
// No global state; every component is stack-local or owned by main().
// -----------------------------------------------------------------------------

#include "backtest/config/backtest_config.hpp"
#include "backtest/core/errors.hpp"
#include "backtest/engine/backtest_report.hpp"
#include "backtest/engine/backtester.hpp"
#include "backtest/engine/component_factory.hpp"

#include <iostream>
#include <optional>
#include <string>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

void printUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " <config.json> [--output <results.json>]\n";
}

}  // namespace

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Parse the command line.
  // -------------------------------------------------------------------------
  std::optional<std::string> config_path;
  std::optional<std::string> output_override;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--output" || arg == "-o") {
      if (i + 1 >= argc) {
        std::cerr << "[main] " << arg << " requires a path\n";
        printUsage(argv[0]);
        return kExitUsage;
      }
      output_override = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      return kExitOk;
    } else if (!config_path) {
      config_path = arg;
    } else {
      std::cerr << "[main] Unexpected argument: " << arg << "\n";
      printUsage(argv[0]);
      return kExitUsage;
    }
  }

  if (!config_path) {
    printUsage(argv[0]);
    return kExitUsage;
  }

  try {
    // -----------------------------------------------------------------------
    // 2) Load configuration and build components.
    // -----------------------------------------------------------------------
    const backtest::BacktestConfig config = backtest::loadConfig(*config_path);
    std::cout << "[main] Loaded configuration from " << *config_path << "\n";

    auto feed = backtest::makeDataFeed(config.data);
    auto strategy = backtest::makeStrategy(config.strategy);
    auto execution = backtest::makeExecutionHandler(config.execution);

    // -----------------------------------------------------------------------
    // 3) Run.
    // -----------------------------------------------------------------------
    backtest::Backtester backtester(backtest::makeSettings(config), *feed,
                                    *strategy, *execution);
    const backtest::BacktestResult result = backtester.run();

    // -----------------------------------------------------------------------
    // 4) Report.
    // -----------------------------------------------------------------------
    std::cout << "[main] Summary for " << strategy->id() << ":\n";
    backtest::printSummary(std::cout, backtest::summarize(result));

    const std::optional<std::string> output =
        output_override ? output_override : config.output_path;
    if (output) {
      backtest::writeResultJson(result, *output);
      std::cout << "[main] Results written to " << *output << "\n";
    }
  } catch (const backtest::BacktestError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return kExitError;
  }

  return kExitOk;
}
