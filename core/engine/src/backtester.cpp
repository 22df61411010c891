#include "backtest/engine/backtester.hpp"
#include "backtest/core/errors.hpp"
#include "backtest/time/time_utils.hpp"

#include <cmath>
#include <iostream>
#include <utility>

namespace backtest {

namespace {

BacktestSettings validated(BacktestSettings settings) {
  if (settings.end < settings.start) {
    throw ContractViolation("backtest end " + formatTimestamp(settings.end) +
                            " is before start " +
                            formatTimestamp(settings.start));
  }
  if (settings.initial_cash < 0.0) {
    throw ContractViolation("initial cash must be non-negative");
  }
  return settings;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: own queue, portfolio and clock; borrow collaborators
// -----------------------------------------------------------------------------
Backtester::Backtester(BacktestSettings settings,
                       IDataFeed& feed,
                       IStrategy& strategy,
                       IExecutionHandler& execution)
    : settings_(validated(std::move(settings))),
      feed_(feed),
      strategy_(strategy),
      execution_(execution),
      portfolio_(settings_.initial_cash, settings_.start),
      clock_(settings_.start) {}

// -----------------------------------------------------------------------------
// run(): outer loop of the state machine
// -----------------------------------------------------------------------------
BacktestResult Backtester::run() {
  if (has_run_) {
    throw ContractViolation("Backtester::run() may only be called once");
  }
  has_run_ = true;

  // An empty list means the strategy wants every ticker; subscribing to the
  // benchmark alone would filter its data out.
  std::vector<std::string> tickers = strategy_.subscribedTickers();
  if (!tickers.empty()) {
    if (settings_.benchmark) {
      tickers.push_back(*settings_.benchmark);
    }
    feed_.subscribe(tickers);
  }

  std::cout << "[Backtester] Starting " << strategy_.id() << " from "
            << formatTimestamp(settings_.start) << " to "
            << formatTimestamp(settings_.end) << " with cash "
            << settings_.initial_cash << "\n";

  state_ = RunState::Running;
  while (state_ != RunState::Stopped) {
    std::vector<Event> batch = feed_.streamNext();
    if (batch.empty() && queue_.empty()) {
      state_ = RunState::Stopped;
      break;
    }

    const bool reached_boundary = ingest(std::move(batch));

    drainQueue();
    maybeRecordSnapshot();

    if (reached_boundary ||
        (clock_.now() >= settings_.end && queue_.empty())) {
      state_ = RunState::Stopped;
    } else {
      state_ = RunState::Running;
    }
  }

  finalize();

  std::cout << "[Backtester] Finished: " << stats_.events_dispatched
            << " events dispatched, " << stats_.fills_applied << " fills, "
            << portfolio_.snapshots().size() << " snapshots, NAV "
            << portfolio_.netValue() << "\n";

  return buildResult();
}

// -----------------------------------------------------------------------------
// ingest(): boundary and monotonicity checks, then enqueue
// -----------------------------------------------------------------------------
bool Backtester::ingest(std::vector<Event> batch) {
  for (std::size_t i = 0; i < batch.size(); ++i) {
    Event& event = batch[i];

    if (!std::holds_alternative<MarketUpdateEvent>(event) &&
        !std::holds_alternative<DividendEvent>(event)) {
      throw ContractViolation(std::string("data feed produced a ") +
                              eventKindName(event) + " event");
    }

    const Timestamp ts = eventTimestamp(event);
    if (ts > settings_.end) {
      const std::size_t dropped = batch.size() - i;
      stats_.events_discarded += dropped;
      std::cout << "[Backtester] Reached end boundary at "
                << formatTimestamp(ts) << "; discarding " << dropped
                << " event(s)\n";
      return true;
    }

    if (!clock_.advance(ts)) {
      ++stats_.events_skipped;
      std::cerr << "[Backtester] WARNING: skipping " << eventKindName(event)
                << " " << eventTicker(event) << " stamped "
                << formatTimestamp(ts) << ", before simulation time "
                << formatTimestamp(clock_.now()) << "\n";
      continue;
    }

    queue_.push(std::move(event));
    ++stats_.events_ingested;
  }
  return false;
}

// -----------------------------------------------------------------------------
// drainQueue(): FIFO until empty
// -----------------------------------------------------------------------------
void Backtester::drainQueue() {
  state_ = RunState::DrainingQueue;

  while (auto event = queue_.try_pop()) {
    const Timestamp ts = eventTimestamp(*event);
    if (ts > settings_.end) {
      ++stats_.events_discarded;
      continue;
    }
    portfolio_.advanceTime(ts);
    dispatch(*event);
    ++stats_.events_dispatched;
  }
}

void Backtester::dispatch(const Event& event) {
  std::visit([this](const auto& e) { handle(e); }, event);
}

// -----------------------------------------------------------------------------
// handle(MarketUpdateEvent): mark, then ask the strategy
// -----------------------------------------------------------------------------
void Backtester::handle(const MarketUpdateEvent& event) {
  portfolio_.updateHoldingPrice(event.ticker, event.price);

  for (auto& signal : strategy_.calculateSignals(event)) {
    ++stats_.signals_generated;
    queue_.push(std::move(signal));
  }
}

// -----------------------------------------------------------------------------
// handle(SignalEvent): pass-through sizing into a MARKET order
// -----------------------------------------------------------------------------
void Backtester::handle(const SignalEvent& event) {
  if (!event.suggested_quantity || !std::isfinite(*event.suggested_quantity) ||
      *event.suggested_quantity <= 0.0) {
    ++stats_.signals_rejected;
    std::cerr << "[Backtester] Rejected " << domain::toString(event.side)
              << " signal for " << event.ticker << " from "
              << event.strategy_id << ": no positive finite suggested quantity\n";
    return;
  }

  OrderEvent order_event;
  order_event.order.id = order_ids_.next_id();
  order_event.order.strategy_id = event.strategy_id;
  order_event.order.ticker = event.ticker;
  order_event.order.side = event.side;
  order_event.order.quantity = *event.suggested_quantity;
  order_event.order.kind = domain::OrderKind::Market;
  order_event.timestamp = event.timestamp;

  ++stats_.orders_submitted;
  queue_.push(std::move(order_event));
}

// -----------------------------------------------------------------------------
// handle(OrderEvent): reference price, then execution policy
// -----------------------------------------------------------------------------
void Backtester::handle(const OrderEvent& event) {
  const domain::Order& order = event.order;

  const std::optional<double> price =
      feed_.latestPrice(order.ticker, event.timestamp);
  if (!price) {
    ++stats_.orders_rejected;
    std::cerr << "[Backtester] Rejected order " << order.id << " ("
              << domain::toString(order.side) << " " << order.ticker
              << "): no price available as of "
              << formatTimestamp(event.timestamp) << "\n";
    return;
  }

  std::optional<FillEvent> fill = execution_.execute(event, *price);
  if (!fill) {
    ++stats_.orders_rejected;
    return;
  }
  queue_.push(std::move(*fill));
}

// -----------------------------------------------------------------------------
// handle(FillEvent): apply to the portfolio; domain rejections are not fatal
// -----------------------------------------------------------------------------
void Backtester::handle(const FillEvent& event) {
  domain::Transaction tx;
  tx.timestamp = event.timestamp;
  tx.ticker = event.ticker;
  tx.side = event.side;
  tx.quantity = event.quantity_filled;
  tx.price = event.fill_price;
  tx.commission = event.commission;
  tx.order_id = event.order_id;

  try {
    portfolio_.applyTransaction(tx);
  } catch (const DomainRejection& e) {
    ++stats_.fills_rejected;
    std::cerr << "[Backtester] Rejected fill " << domain::toString(tx.side)
              << " " << tx.quantity << " " << tx.ticker << " @ " << tx.price
              << ": " << e.what() << "\n";
    return;
  }

  ++stats_.fills_applied;
  std::cout << "[Backtester] " << formatTimestamp(tx.timestamp) << " "
            << domain::toString(tx.side) << " " << tx.quantity << " "
            << tx.ticker << " @ " << tx.price << " (commission "
            << tx.commission << "), cash " << portfolio_.cash() << "\n";
}

void Backtester::handle(const DividendEvent& event) {
  if (portfolio_.applyDividend(event)) {
    ++stats_.dividends_applied;
  }
}

// -----------------------------------------------------------------------------
// maybeRecordSnapshot(): at most one per date, never past the end date
// -----------------------------------------------------------------------------
void Backtester::maybeRecordSnapshot() {
  const DayNumber day = clock_.currentDay();
  const DayNumber end_day = dayNumber(settings_.end);

  if (last_snapshot_day_ && day <= *last_snapshot_day_) {
    return;
  }
  if (day > end_day) {
    return;
  }
  portfolio_.recordSnapshot(clock_.now());
  last_snapshot_day_ = day;
}

// -----------------------------------------------------------------------------
// finalize(): closing snapshot at the end boundary
// -----------------------------------------------------------------------------
void Backtester::finalize() {
  const DayNumber end_day = dayNumber(settings_.end);
  const bool end_date_missing =
      !last_snapshot_day_ || *last_snapshot_day_ < end_day;

  if (end_date_missing && portfolio_.currentTime() <= settings_.end) {
    portfolio_.recordSnapshot(settings_.end);
    last_snapshot_day_ = end_day;
  }
}

BacktestResult Backtester::buildResult() const {
  BacktestResult result;
  result.settings = settings_;
  result.snapshots = portfolio_.snapshots();
  result.ledger = portfolio_.ledger();
  result.dividends = portfolio_.dividends();
  result.final_cash = portfolio_.cash();
  result.final_net_value = portfolio_.netValue();
  result.realized_pnl = portfolio_.realizedPnl();
  result.total_commission = portfolio_.totalCommission();
  result.stats = stats_;
  return result;
}

}  // namespace backtest
