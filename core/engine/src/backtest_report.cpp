#include "backtest/engine/backtest_report.hpp"
#include "backtest/codec/event_json.hpp"
#include "backtest/core/errors.hpp"
#include "backtest/time/time_utils.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <utility>

namespace backtest {

// -----------------------------------------------------------------------------
// summarize
// -----------------------------------------------------------------------------
PerformanceSummary summarize(const BacktestResult& result) {
  PerformanceSummary s;
  s.initial_cash = result.settings.initial_cash;
  s.final_net_value = result.final_net_value;
  s.realized_pnl = result.realized_pnl;
  s.total_commission = result.total_commission;
  s.trades = result.ledger.size();
  s.snapshots = result.snapshots.size();

  if (s.initial_cash > 0.0) {
    s.total_return = (s.final_net_value - s.initial_cash) / s.initial_cash;
  }

  for (const auto& record : result.dividends) {
    s.total_dividends += record.amount;
  }

  double peak = 0.0;
  for (const auto& snap : result.snapshots) {
    peak = std::max(peak, snap.net_value);
    if (peak > 0.0) {
      s.max_drawdown = std::max(s.max_drawdown, (peak - snap.net_value) / peak);
    }
  }
  return s;
}

void printSummary(std::ostream& out, const PerformanceSummary& s) {
  const auto flags = out.flags();
  const auto precision = out.precision();

  out << std::fixed << std::setprecision(2);
  out << "  Initial cash:      " << s.initial_cash << "\n"
      << "  Final net value:   " << s.final_net_value << "\n"
      << "  Total return:      " << s.total_return * 100.0 << " %\n"
      << "  Max drawdown:      " << s.max_drawdown * 100.0 << " %\n"
      << "  Realized P&L:      " << s.realized_pnl << "\n"
      << "  Commission paid:   " << s.total_commission << "\n"
      << "  Dividends:         " << s.total_dividends << "\n"
      << "  Trades:            " << s.trades << "\n"
      << "  Snapshots:         " << s.snapshots << "\n";

  out.flags(flags);
  out.precision(precision);
}

// -----------------------------------------------------------------------------
// resultToJson
// -----------------------------------------------------------------------------
nlohmann::json resultToJson(const BacktestResult& result) {
  nlohmann::json j;

  nlohmann::json settings;
  settings["start"] = formatTimestamp(result.settings.start);
  settings["end"] = formatTimestamp(result.settings.end);
  settings["initial_cash"] = result.settings.initial_cash;
  if (result.settings.benchmark) {
    settings["benchmark"] = *result.settings.benchmark;
  } else {
    settings["benchmark"] = nullptr;
  }
  j["settings"] = std::move(settings);

  const PerformanceSummary s = summarize(result);
  nlohmann::json summary;
  summary["final_cash"] = result.final_cash;
  summary["final_net_value"] = s.final_net_value;
  summary["total_return"] = s.total_return;
  summary["max_drawdown"] = s.max_drawdown;
  summary["realized_pnl"] = s.realized_pnl;
  summary["total_commission"] = s.total_commission;
  summary["total_dividends"] = s.total_dividends;
  summary["trades"] = s.trades;
  j["summary"] = std::move(summary);

  const RunStats& st = result.stats;
  nlohmann::json stats;
  stats["events_ingested"] = st.events_ingested;
  stats["events_dispatched"] = st.events_dispatched;
  stats["events_skipped"] = st.events_skipped;
  stats["events_discarded"] = st.events_discarded;
  stats["signals_generated"] = st.signals_generated;
  stats["signals_rejected"] = st.signals_rejected;
  stats["orders_submitted"] = st.orders_submitted;
  stats["orders_rejected"] = st.orders_rejected;
  stats["fills_applied"] = st.fills_applied;
  stats["fills_rejected"] = st.fills_rejected;
  stats["dividends_applied"] = st.dividends_applied;
  j["stats"] = std::move(stats);

  nlohmann::json snapshots = nlohmann::json::array();
  for (const auto& snap : result.snapshots) {
    snapshots.push_back(snapshotToJson(snap));
  }
  j["snapshots"] = std::move(snapshots);

  nlohmann::json transactions = nlohmann::json::array();
  for (const auto& tx : result.ledger) {
    transactions.push_back(transactionToJson(tx));
  }
  j["transactions"] = std::move(transactions);

  nlohmann::json dividends = nlohmann::json::array();
  for (const auto& record : result.dividends) {
    dividends.push_back(dividendRecordToJson(record));
  }
  j["dividends"] = std::move(dividends);

  return j;
}

void writeResultJson(const BacktestResult& result, const std::string& path) {
  std::ofstream file(path);
  if (!file.is_open()) {
    throw DataError("cannot open results file for writing: " + path);
  }
  file << resultToJson(result).dump(2) << "\n";
  if (!file) {
    throw DataError("failed writing results file: " + path);
  }
}

}  // namespace backtest
