#pragma once

#include "backtest/events/event_types.hpp"
#include "backtest/events/fill_event.hpp"
#include "backtest/events/order_event.hpp"

#include <variant>

namespace backtest {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single "envelope" type for the five event kinds that
// flow through the simulation: market update → signal → order → fill, plus
// dividends.
//
// Closed set: the Backtester dispatches with std::visit, and a kind without
// a handle() overload fails to compile. Events are values and are copied
// into the queue.
// -----------------------------------------------------------------------------
using Event = std::variant<
    MarketUpdateEvent,
    SignalEvent,
    OrderEvent,
    FillEvent,
    DividendEvent>;

// -----------------------------------------------------------------------------
// eventTimestamp
// -----------------------------------------------------------------------------
// @brief  Returns the timestamp of whichever alternative the event holds.
// -----------------------------------------------------------------------------
inline Timestamp eventTimestamp(const Event& event) {
  return std::visit([](const auto& e) { return e.timestamp; }, event);
}

// -----------------------------------------------------------------------------
// eventKindName
// -----------------------------------------------------------------------------
// @brief  Short upper-case name of the event kind, used in log lines.
// -----------------------------------------------------------------------------
inline const char* eventKindName(const Event& event) {
  switch (event.index()) {
    case 0: return "MARKET";
    case 1: return "SIGNAL";
    case 2: return "ORDER";
    case 3: return "FILL";
    case 4: return "DIVIDEND";
  }
  return "INVALID";
}

// Ticker the event refers to.
inline const std::string& eventTicker(const Event& event) {
  struct Visitor {
    const std::string& operator()(const MarketUpdateEvent& e) const { return e.ticker; }
    const std::string& operator()(const SignalEvent& e) const { return e.ticker; }
    const std::string& operator()(const OrderEvent& e) const { return e.order.ticker; }
    const std::string& operator()(const FillEvent& e) const { return e.ticker; }
    const std::string& operator()(const DividendEvent& e) const { return e.ticker; }
  };
  return std::visit(Visitor{}, event);
}

}  // namespace backtest
