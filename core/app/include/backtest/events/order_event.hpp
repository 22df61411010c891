#pragma once

#include "backtest/domain/order.hpp"
#include "backtest/events/event_types.hpp"

namespace backtest {

// -----------------------------------------------------------------------------
// OrderEvent
// -----------------------------------------------------------------------------
// Responsibility: Wraps a domain::Order so it can travel through the event
// queue.
//
// The timestamp is the time the originating signal was generated. The
// Backtester uses it as the as-of time for the reference price lookup.
// -----------------------------------------------------------------------------
struct OrderEvent {
  domain::Order order;
  Timestamp timestamp{};
};

}  // namespace backtest
