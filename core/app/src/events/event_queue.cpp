#include "backtest/events/event_queue.hpp"
#include "backtest/core/errors.hpp"

#include <utility>

namespace backtest {

// -----------------------------------------------------------------------------
// push(): validate and append to the tail
// -----------------------------------------------------------------------------
void EventQueue::push(Event event) {
  // A variant only becomes valueless when an assignment threw half-way. Such
  // a value carries no event kind and no timestamp, so it cannot be ordered
  // or dispatched.
  if (event.valueless_by_exception()) {
    throw TypeContractError("EventQueue accepts only events; got a valueless variant");
  }
  queue_.push_back(std::move(event));
}

// -----------------------------------------------------------------------------
// try_pop(): remove the head, or report empty
// -----------------------------------------------------------------------------
std::optional<Event> EventQueue::try_pop() {
  if (queue_.empty()) {
    return std::nullopt;
  }
  Event value = std::move(queue_.front());
  queue_.pop_front();
  return value;
}

}  // namespace backtest
