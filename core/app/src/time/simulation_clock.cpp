#include "backtest/time/simulation_clock.hpp"

namespace backtest {

// -----------------------------------------------------------------------------
// advance(): move forward only
// -----------------------------------------------------------------------------
bool SimulationClock::advance(Timestamp t) {
  // Equal timestamps are normal: a bar batch carries many tickers stamped
  // with the same instant.
  if (t < now_) {
    return false;
  }
  now_ = t;
  return true;
}

}  // namespace backtest
