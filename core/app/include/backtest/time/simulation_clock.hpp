#pragma once

#include "backtest/events/event_types.hpp"
#include "backtest/time/time_utils.hpp"

namespace backtest {

// -----------------------------------------------------------------------------
// SimulationClock — externally-driven clock for backtesting
// -----------------------------------------------------------------------------
//
// @brief  Holds the Backtester's notion of "now". Time is set explicitly by
//         the data ingestion step rather than read from the system clock.
//
// @details
// During a backtest the engine must believe that "now" is whatever timestamp
// the historical data says it is. When the Backtester enqueues a bar stamped
// 2024-01-02 it calls advance() with that timestamp; every later query sees
// it until the next bar moves the clock further.
//
// This is the key to deterministic backtesting:
//   - No look-ahead bias:  the engine only sees time that data has revealed.
//   - Reproducibility:     identical data → identical timestamps → identical
//                          signals, fills and snapshots across runs.
//
// Monotonicity is enforced: advance() refuses to move backwards and reports
// the refusal to the caller, which treats it as a feed contract violation.
//
// Thread model:
//   Owned by the Backtester and touched only from the simulation loop. No
//   synchronization.
// -----------------------------------------------------------------------------
class SimulationClock {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Starts the clock at the configured run start. Events stamped
  //         before this instant are rejected as regressions.
  // -------------------------------------------------------------------------
  explicit SimulationClock(Timestamp start) : now_(start) {}

  Timestamp now() const { return now_; }

  DayNumber currentDay() const { return dayNumber(now_); }

  // -------------------------------------------------------------------------
  // advance(t)
  // -------------------------------------------------------------------------
  // @brief  Moves the clock to t.
  //
  // @return true if the clock now reads t; false if t lies before the
  //         current time, in which case the clock is unchanged.
  // -------------------------------------------------------------------------
  bool advance(Timestamp t);

 private:
  Timestamp now_;
};

}  // namespace backtest
