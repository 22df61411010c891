#include "backtest/portfolio/portfolio.hpp"
#include "backtest/core/errors.hpp"
#include "backtest/time/time_utils.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <utility>

namespace backtest {

namespace {

std::string describe(const domain::Transaction& tx) {
  return std::string(domain::toString(tx.side)) + " " +
         std::to_string(tx.quantity) + " " + tx.ticker + " @ " +
         std::to_string(tx.price);
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
Portfolio::Portfolio(double initial_cash, Timestamp start)
    : cash_(initial_cash), current_time_(start) {
  if (!std::isfinite(initial_cash) || initial_cash < 0.0) {
    throw ContractViolation("initial cash must be finite and non-negative, got " +
                            std::to_string(initial_cash));
  }
}

// -----------------------------------------------------------------------------
// Cash primitives
// -----------------------------------------------------------------------------
void Portfolio::addCash(double amount) {
  if (!std::isfinite(amount) || amount < 0.0) {
    throw ContractViolation("cash amount to add must be finite and non-negative, got " +
                            std::to_string(amount));
  }
  cash_ += amount;
}

void Portfolio::removeCash(double amount) {
  if (!std::isfinite(amount) || amount < 0.0) {
    throw ContractViolation("cash amount to remove must be finite and non-negative, got " +
                            std::to_string(amount));
  }
  if (amount > cash_) {
    throw InsufficientFundsError("need " + std::to_string(amount) +
                                 ", have " + std::to_string(cash_));
  }
  cash_ -= amount;
}

void Portfolio::updateHoldingPrice(const std::string& ticker, double price) {
  if (!std::isfinite(price) || price < 0.0) {
    throw ContractViolation("price for " + ticker + " must be finite and non-negative, got " +
                            std::to_string(price));
  }
  auto it = holdings_.find(ticker);
  if (it == holdings_.end()) {
    return;
  }
  it->second.updatePrice(price);
}

// -----------------------------------------------------------------------------
// applyTransaction(): validate everything, then mutate
// -----------------------------------------------------------------------------
void Portfolio::applyTransaction(const domain::Transaction& tx) {
  // --- Contract checks ------------------------------------------------------
  if (tx.ticker.empty()) {
    throw ContractViolation("transaction ticker must be non-empty");
  }
  if (!std::isfinite(tx.quantity) || tx.quantity <= 0.0) {
    throw ContractViolation("transaction quantity must be finite and positive: " + describe(tx));
  }
  if (!std::isfinite(tx.price) || tx.price < 0.0) {
    throw ContractViolation("transaction price must be finite and non-negative: " + describe(tx));
  }
  if (!std::isfinite(tx.commission) || tx.commission < 0.0) {
    throw ContractViolation("commission must be finite and non-negative, got " +
                            std::to_string(tx.commission));
  }

  // --- Domain checks --------------------------------------------------------
  // Each case finishes its checks before calling the apply helper. The
  // helpers cannot fail once the checks have passed.
  switch (tx.side) {
    case domain::Side::Buy: {
      const double total = tx.commission + tx.grossValue();
      if (total > cash_) {
        throw InsufficientFundsError(describe(tx) + " costs " +
                                     std::to_string(total) + ", have " +
                                     std::to_string(cash_));
      }
      applyBuy(tx);
      break;
    }
    case domain::Side::Sell: {
      auto it = holdings_.find(tx.ticker);
      if (it == holdings_.end()) {
        throw NotHeldError(describe(tx) + ": no position in " + tx.ticker);
      }
      if (!it->second.covers(tx.quantity)) {
        throw InsufficientPositionError(describe(tx) + ": only " +
                                        std::to_string(it->second.quantity()) +
                                        " held");
      }
      if (tx.commission > cash_) {
        throw InsufficientFundsError("commission " + std::to_string(tx.commission) +
                                     " on " + describe(tx) + " exceeds cash " +
                                     std::to_string(cash_));
      }
      applySell(tx);
      break;
    }
    default:
      throw UnknownTransactionTypeError(
          "side value " + std::to_string(static_cast<int>(tx.side)) + " on " +
          tx.ticker);
  }

  total_commission_ += tx.commission;
  ledger_.push_back(tx);
}

void Portfolio::applyBuy(const domain::Transaction& tx) {
  removeCash(tx.commission + tx.grossValue());
  auto it = holdings_.try_emplace(tx.ticker, tx.ticker).first;
  it->second.addShares(tx.quantity, tx.price);
}

void Portfolio::applySell(const domain::Transaction& tx) {
  removeCash(tx.commission);
  const double proceeds = tx.grossValue();
  addCash(proceeds);

  auto it = holdings_.find(tx.ticker);
  const double cost_basis = it->second.removeShares(tx.quantity);
  realized_pnl_ += proceeds - cost_basis;

  if (it->second.quantity() == 0.0) {
    holdings_.erase(it);
  }
}

// -----------------------------------------------------------------------------
// applyDividend(): credit held tickers only
// -----------------------------------------------------------------------------
bool Portfolio::applyDividend(const DividendEvent& event) {
  if (!std::isfinite(event.dividend_per_share) || event.dividend_per_share < 0.0) {
    throw ContractViolation("dividend per share for " + event.ticker +
                            " must be finite and non-negative, got " +
                            std::to_string(event.dividend_per_share));
  }
  auto it = holdings_.find(event.ticker);
  if (it == holdings_.end()) {
    return false;
  }

  DividendRecord record;
  record.timestamp = event.timestamp;
  record.ticker = event.ticker;
  record.quantity_held = it->second.quantity();
  record.dividend_per_share = event.dividend_per_share;
  record.amount = record.quantity_held * record.dividend_per_share;

  addCash(record.amount);
  dividends_.push_back(record);

  std::cout << "[Portfolio] Dividend " << record.ticker << " "
            << record.dividend_per_share << "/share on "
            << record.quantity_held << " shares = " << record.amount
            << " (" << formatDate(record.timestamp) << ")\n";
  return true;
}

// -----------------------------------------------------------------------------
// Valuation
// -----------------------------------------------------------------------------
double Portfolio::totalHoldingsValue() const {
  double total = 0.0;
  for (const auto& [ticker, holding] : holdings_) {
    total += holding.marketValue();
  }
  return total;
}

double Portfolio::netValue() const {
  return totalHoldingsValue() + cash_;
}

const Snapshot& Portfolio::recordSnapshot(Timestamp ts) {
  Snapshot snap;
  snap.timestamp = ts;
  snap.cash = cash_;
  snap.holdings.reserve(holdings_.size());
  for (const auto& [ticker, holding] : holdings_) {
    HoldingSnapshot h;
    h.ticker = ticker;
    h.quantity = holding.quantity();
    h.average_cost = holding.averageCost();
    h.last_price = holding.lastPrice();
    h.market_value = holding.marketValue();
    snap.holdings_value += h.market_value;
    snap.holdings.push_back(std::move(h));
  }
  snap.net_value = snap.cash + snap.holdings_value;

  snapshots_.push_back(std::move(snap));
  return snapshots_.back();
}

bool Portfolio::advanceTime(Timestamp t) {
  if (t < current_time_) {
    return false;
  }
  current_time_ = t;
  return true;
}

const domain::Holding* Portfolio::holding(const std::string& ticker) const {
  auto it = holdings_.find(ticker);
  return (it != holdings_.end()) ? &it->second : nullptr;
}

}  // namespace backtest
