#include "backtest/config/backtest_config.hpp"
#include "backtest/core/errors.hpp"
#include "backtest/time/time_utils.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace backtest {

namespace {

const nlohmann::json& requireKey(const nlohmann::json& j, const char* key,
                                 const std::string& where) {
  if (!j.is_object() || !j.contains(key)) {
    throw ConfigError("missing '" + where + key + "'");
  }
  return j.at(key);
}

Timestamp readTime(const nlohmann::json& j, const char* key, bool end_of_day) {
  const auto& value = requireKey(j, key, "");
  if (!value.is_string()) {
    throw ConfigError(std::string("'") + key + "' must be a date string");
  }
  bool date_only = false;
  Timestamp ts;
  try {
    ts = parseTimestamp(value.get<std::string>(), &date_only);
  } catch (const DataError&) {
    throw ConfigError(std::string("'") + key + "': invalid date '" +
                      value.get<std::string>() + "'");
  }
  if (date_only && end_of_day) {
    ts = endOfDay(dayNumber(ts));
  }
  return ts;
}

std::string resolvePath(const std::string& path, const std::string& base_dir) {
  if (path.empty() || base_dir.empty()) {
    return path;
  }
  const std::filesystem::path p(path);
  if (p.is_absolute()) {
    return path;
  }
  return (std::filesystem::path(base_dir) / p).lexically_normal().string();
}

DataConfig parseData(const nlohmann::json& j, const std::string& base_dir) {
  DataConfig data;
  const std::string source = j.value("source", std::string("csv"));

  if (source == "csv") {
    data.source = DataConfig::Source::Csv;
    data.prices_path = resolvePath(
        requireKey(j, "prices", "data.").get<std::string>(), base_dir);
    data.dividends_path =
        resolvePath(j.value("dividends", std::string()), base_dir);
    return data;
  }

  if (source == "zmq") {
    data.source = DataConfig::Source::Zmq;
    data.endpoint = j.value("endpoint", data.endpoint);
    const auto timeout_ms = j.value("idle_timeout_ms",
                                    static_cast<std::int64_t>(data.idle_timeout.count()));
    if (timeout_ms <= 0) {
      throw ConfigError("'data.idle_timeout_ms' must be positive");
    }
    data.idle_timeout = std::chrono::milliseconds{timeout_ms};
    return data;
  }

  throw ConfigError("unknown data source '" + source + "' (expected csv or zmq)");
}

ExecutionConfig parseExecution(const nlohmann::json& j) {
  ExecutionConfig exec;
  exec.commission_per_share = j.value("commission_per_share", 0.0);
  exec.pct_commission = j.value("pct_commission", 0.0);
  exec.min_commission = j.value("min_commission", 0.0);
  if (exec.commission_per_share < 0.0 || exec.pct_commission < 0.0 ||
      exec.min_commission < 0.0) {
    throw ConfigError("execution commission rates must be non-negative");
  }
  return exec;
}

}  // namespace

// -----------------------------------------------------------------------------
// parseConfig
// -----------------------------------------------------------------------------
BacktestConfig parseConfig(const nlohmann::json& json,
                           const std::string& base_dir) {
  if (!json.is_object()) {
    throw ConfigError("configuration root must be a JSON object");
  }

  BacktestConfig cfg;
  try {
    cfg.start = readTime(json, "start", false);
    cfg.end = readTime(json, "end", true);
    if (cfg.end < cfg.start) {
      throw ConfigError("'end' (" + formatTimestamp(cfg.end) +
                        ") is before 'start' (" + formatTimestamp(cfg.start) + ")");
    }

    cfg.initial_cash = requireKey(json, "initial_cash", "").get<double>();
    if (cfg.initial_cash < 0.0) {
      throw ConfigError("'initial_cash' must be non-negative");
    }

    if (json.contains("benchmark") && !json.at("benchmark").is_null()) {
      cfg.benchmark = json.at("benchmark").get<std::string>();
    }

    cfg.data = parseData(requireKey(json, "data", ""), base_dir);

    const auto& strat = requireKey(json, "strategy", "");
    cfg.strategy.type = requireKey(strat, "type", "strategy.").get<std::string>();
    cfg.strategy.id = strat.value("id", cfg.strategy.type);
    if (strat.contains("params")) {
      cfg.strategy.params = strat.at("params");
    }

    if (json.contains("execution")) {
      cfg.execution = parseExecution(json.at("execution"));
    }

    if (json.contains("output") && !json.at("output").is_null()) {
      cfg.output_path =
          resolvePath(json.at("output").get<std::string>(), base_dir);
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid value: ") + e.what());
  }
  return cfg;
}

// -----------------------------------------------------------------------------
// loadConfig
// -----------------------------------------------------------------------------
BacktestConfig loadConfig(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("cannot open configuration file: " + path);
  }

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(path + ": " + e.what());
  }

  const std::string base_dir =
      std::filesystem::path(path).parent_path().string();
  return parseConfig(json, base_dir);
}

}  // namespace backtest
