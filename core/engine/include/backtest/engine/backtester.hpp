#pragma once

#include "backtest/domain/order_id_generator.hpp"
#include "backtest/domain/transaction.hpp"
#include "backtest/events/event_queue.hpp"
#include "backtest/execution/i_execution_handler.hpp"
#include "backtest/feed/i_data_feed.hpp"
#include "backtest/portfolio/portfolio.hpp"
#include "backtest/strategy/i_strategy.hpp"
#include "backtest/time/simulation_clock.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// BacktestSettings
// -----------------------------------------------------------------------------
// start and end are both inclusive. benchmark is subscribed on the feed but
// never traded or used in accounting.
// -----------------------------------------------------------------------------
struct BacktestSettings {
  Timestamp start{};
  Timestamp end{};
  double initial_cash{0.0};
  std::optional<std::string> benchmark;
};

enum class RunState {
  Running,
  DrainingQueue,
  Stopped,
};

inline const char* toString(RunState state) {
  switch (state) {
    case RunState::Running:       return "Running";
    case RunState::DrainingQueue: return "DrainingQueue";
    case RunState::Stopped:       return "Stopped";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// RunStats
// -----------------------------------------------------------------------------
// Counters collected during one run. "Rejected" counters are domain
// rejections: the event was logged and dropped and the run continued.
// -----------------------------------------------------------------------------
struct RunStats {
  std::size_t events_ingested{0};     // Feed events enqueued
  std::size_t events_dispatched{0};   // Events handled by dispatch()
  std::size_t events_skipped{0};      // Feed events before the clock
  std::size_t events_discarded{0};    // Events beyond the end boundary
  std::size_t signals_generated{0};
  std::size_t signals_rejected{0};
  std::size_t orders_submitted{0};
  std::size_t orders_rejected{0};
  std::size_t fills_applied{0};
  std::size_t fills_rejected{0};
  std::size_t dividends_applied{0};
};

// -----------------------------------------------------------------------------
// BacktestResult
// -----------------------------------------------------------------------------
struct BacktestResult {
  BacktestSettings settings;
  std::vector<Snapshot> snapshots;
  std::vector<domain::Transaction> ledger;
  std::vector<DividendRecord> dividends;
  double final_cash{0.0};
  double final_net_value{0.0};
  double realized_pnl{0.0};
  double total_commission{0.0};
  RunStats stats;
};

// -----------------------------------------------------------------------------
// Backtester
// -----------------------------------------------------------------------------
//
// @brief  Central orchestrator of one simulation run. Pulls data from the
//         feed, drives the event queue and owns the portfolio.
//
// @details
// The Backtester is the programmatic root of a run. It owns the EventQueue,
// the Portfolio, the SimulationClock and the OrderIdGenerator by value. The
// feed, strategy and execution handler are borrowed by reference; none of
// them ever sees the queue or the portfolio.
//
// State machine (run()):
//
//   Running ──► pull a batch from the feed
//     │           empty batch and empty queue ──────────────► Stopped
//     │           for each event:
//     │             timestamp > end   → discard it and the rest
//     │                                 of the batch, stop after
//     │                                 this iteration
//     │             timestamp < clock → log and skip
//     │             otherwise         → enqueue, advance clock
//     ▼
//   DrainingQueue ──► pop until empty, dispatch each event
//     │
//     ▼
//   record a snapshot if the clock's date is new and within the end date
//   clock >= end and queue empty ───────────────────────────► Stopped
//   otherwise ──────────────────────────────────────────────► Running
//
// After Stopped, one final snapshot stamped at the end boundary is recorded
// if the last snapshot date is before the end date and the portfolio's time
// is not past the end.
//
// Dispatch (one handle() overload per event kind, selected by std::visit):
//
//   MarketUpdate → mark the portfolio, ask the strategy, enqueue signals
//   Signal       → reject without a positive quantity, else enqueue a
//                  MARKET order with a fresh id
//   Order        → look up the reference price as of the order time,
//                  execute, enqueue the fill
//   Fill         → apply to the portfolio as a Transaction
//   Dividend     → apply to the portfolio
//
// Because handlers push downstream events onto the same FIFO queue, a single
// market update resolves into a completed fill within one drain pass.
//
// Errors:
//   Domain rejections (DomainRejection, missing price, refused order,
//   non-positive signal quantity) are logged to std::cerr, counted in
//   RunStats and dropped. ContractViolation propagates out of run().
//
// Thread model:
//   Single-threaded and synchronous. run() executes entirely on the
//   caller's thread.
// -----------------------------------------------------------------------------
class Backtester {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  settings   Run window, initial cash and benchmark.
  // @param  feed       Market data source. Must outlive this object.
  // @param  strategy   Signal generator. Must outlive this object.
  // @param  execution  Execution policy. Must outlive this object.
  //
  // @throws ContractViolation if end < start or initial_cash < 0.
  // -------------------------------------------------------------------------
  Backtester(BacktestSettings settings,
             IDataFeed& feed,
             IStrategy& strategy,
             IExecutionHandler& execution);

  Backtester(const Backtester&) = delete;
  Backtester& operator=(const Backtester&) = delete;
  Backtester(Backtester&&) = delete;
  Backtester& operator=(Backtester&&) = delete;

  // -------------------------------------------------------------------------
  // run()
  // -------------------------------------------------------------------------
  // @brief  Executes the simulation to completion and returns its result.
  //
  // @throws ContractViolation if called more than once, or if any component
  //         breaks an operation contract during the run.
  // -------------------------------------------------------------------------
  BacktestResult run();

  RunState state() const { return state_; }
  const BacktestSettings& settings() const { return settings_; }
  const Portfolio& portfolio() const { return portfolio_; }
  const EventQueue& queue() const { return queue_; }
  const SimulationClock& clock() const { return clock_; }
  const RunStats& stats() const { return stats_; }

 private:
  // Enqueues a feed batch. Returns true if an event beyond the end boundary
  // was seen.
  bool ingest(std::vector<Event> batch);

  void drainQueue();
  void dispatch(const Event& event);

  void handle(const MarketUpdateEvent& event);
  void handle(const SignalEvent& event);
  void handle(const OrderEvent& event);
  void handle(const FillEvent& event);
  void handle(const DividendEvent& event);

  void maybeRecordSnapshot();
  void finalize();
  BacktestResult buildResult() const;

  BacktestSettings settings_;
  IDataFeed& feed_;
  IStrategy& strategy_;
  IExecutionHandler& execution_;

  EventQueue queue_;
  Portfolio portfolio_;
  SimulationClock clock_;
  OrderIdGenerator order_ids_;

  RunState state_{RunState::Running};
  RunStats stats_;
  std::optional<DayNumber> last_snapshot_day_;
  bool has_run_{false};
};

}  // namespace backtest
