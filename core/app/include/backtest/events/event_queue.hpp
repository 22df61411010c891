#pragma once

#include "backtest/events/event.hpp"

#include <cstddef>
#include <deque>
#include <optional>

namespace backtest {

// -----------------------------------------------------------------------------
// EventQueue
// -----------------------------------------------------------------------------
// Responsibility: The FIFO buffer of pending events and the only channel
// between the feed, strategy, execution handler and portfolio during a run.
//
// Why in architecture: Every handler communicates by pushing new events; the
// Backtester drains the queue until it is empty. One market update can
// therefore resolve into a signal, an order and a fill within a single drain
// pass.
//
// Ordering: strictly insertion order. No priority by timestamp and no
// deduplication; callers establish temporal order before pushing.
//
// Thread model: Single-threaded. The Backtester owns the queue exclusively
// for the duration of a run; there is no mutex and try_pop() never blocks.
// -----------------------------------------------------------------------------
class EventQueue {
 public:
  EventQueue() = default;

  // Non-copyable: a run owns exactly one queue.
  EventQueue(const EventQueue&) = delete;
  EventQueue& operator=(const EventQueue&) = delete;

  EventQueue(EventQueue&&) = default;
  EventQueue& operator=(EventQueue&&) = default;

  // -------------------------------------------------------------------------
  // push(event)
  // -------------------------------------------------------------------------
  // What: Appends one event to the tail.
  // Input: event, taken by value so callers can std::move.
  // Throws: TypeContractError if the variant is valueless (it holds no
  //         event). Values that are not events at all do not compile.
  // -------------------------------------------------------------------------
  void push(Event event);

  // -------------------------------------------------------------------------
  // try_pop()
  // -------------------------------------------------------------------------
  // What: Removes and returns the head event, or std::nullopt when the queue
  // is empty. Never blocks.
  // -------------------------------------------------------------------------
  std::optional<Event> try_pop();

  bool empty() const { return queue_.empty(); }
  std::size_t size() const { return queue_.size(); }

 private:
  std::deque<Event> queue_;
};

}  // namespace backtest
