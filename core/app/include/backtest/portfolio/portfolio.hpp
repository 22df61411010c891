#pragma once

#include "backtest/domain/holding.hpp"
#include "backtest/domain/transaction.hpp"
#include "backtest/events/event_types.hpp"
#include "backtest/portfolio/snapshot.hpp"

#include <map>
#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// Portfolio — cash, holdings and ledgers for one backtest run
// -----------------------------------------------------------------------------
//
// @brief  Consumes transactions and dividends, answers valuation queries and
//         keeps the snapshot series that becomes the run's equity curve.
//
// @details
// State:
//
//   1. cash_: never negative. addCash() and removeCash() are the only
//      primitives that change it; every other mutator goes through them.
//
//   2. holdings_: ticker → Holding, ordered by ticker so that snapshots and
//      reports list positions deterministically. A key exists only while
//      its quantity is positive; it is erased the moment a sale takes the
//      quantity to exactly 0.
//
//   3. ledger_: append-only list of applied transactions.
//
//   4. dividends_: append-only list of dividend credits. Dividends are not
//      transactions and never appear in ledger_.
//
//   5. snapshots_: append-only. The portfolio does not deduplicate; the
//      Backtester decides when to record.
//
// Atomicity:
//   applyTransaction() validates every precondition before touching any
//   state. A rejected transaction leaves cash, holdings, ledger, realized
//   P&L and commission totals exactly as they were.
//
// Accounting rules:
//
//   BUY   cash -= commission + quantity * price
//         holding.addShares(quantity, price)
//
//   SELL  cash -= commission
//         cash += quantity * price
//         cost_basis = holding.removeShares(quantity)
//         realized_pnl += quantity * price - cost_basis
//
// Thread model:
//   Owned by the Backtester and touched only from the simulation loop.
// -----------------------------------------------------------------------------
class Portfolio {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  initial_cash  Starting cash balance, must be >= 0.
  // @param  start         Initial current_time.
  // @throws ContractViolation if initial_cash < 0.
  // -------------------------------------------------------------------------
  Portfolio(double initial_cash, Timestamp start);

  Portfolio(const Portfolio&) = delete;
  Portfolio& operator=(const Portfolio&) = delete;

  // -------------------------------------------------------------------------
  // addCash / removeCash
  // -------------------------------------------------------------------------
  // @throws ContractViolation       if amount < 0.
  //         InsufficientFundsError  (removeCash) if amount > cash.
  // -------------------------------------------------------------------------
  void addCash(double amount);
  void removeCash(double amount);

  // Re-marks a held ticker. Unheld tickers are ignored.
  // @throws ContractViolation if price < 0.
  void updateHoldingPrice(const std::string& ticker, double price);

  // -------------------------------------------------------------------------
  // applyTransaction(tx)
  // -------------------------------------------------------------------------
  // @brief  Applies a BUY or SELL atomically and appends it to the ledger.
  //
  // @throws ContractViolation            quantity <= 0, price < 0,
  //                                      commission < 0, empty ticker.
  //         InsufficientFundsError       BUY whose cost plus commission
  //                                      exceeds cash, or SELL whose
  //                                      commission exceeds cash.
  //         NotHeldError                 SELL of a ticker not held.
  //         InsufficientPositionError    SELL of more than is held.
  //         UnknownTransactionTypeError  side is neither BUY nor SELL.
  //
  //         On any throw the portfolio is unchanged.
  // -------------------------------------------------------------------------
  void applyTransaction(const domain::Transaction& tx);

  // -------------------------------------------------------------------------
  // applyDividend(event)
  // -------------------------------------------------------------------------
  // @brief  Credits quantity_held * dividend_per_share for a held ticker and
  //         records a DividendRecord stamped with the event timestamp.
  //
  // @return true if cash was credited; false if the ticker is not held.
  // @throws ContractViolation if dividend_per_share < 0.
  // -------------------------------------------------------------------------
  bool applyDividend(const DividendEvent& event);

  double netValue() const;
  double totalHoldingsValue() const;

  // Appends a valuation of the current state stamped with ts.
  const Snapshot& recordSnapshot(Timestamp ts);

  // -------------------------------------------------------------------------
  // advanceTime(t)
  // -------------------------------------------------------------------------
  // @return true if current_time moved (or stayed) at t; false if t lies
  //         before current_time, which is left unchanged.
  // -------------------------------------------------------------------------
  bool advanceTime(Timestamp t);

  double cash() const { return cash_; }
  Timestamp currentTime() const { return current_time_; }
  double realizedPnl() const { return realized_pnl_; }
  double totalCommission() const { return total_commission_; }

  const std::map<std::string, domain::Holding>& holdings() const {
    return holdings_;
  }

  // Returns nullptr if the ticker is not held. The pointer is valid until
  // the next mutation.
  const domain::Holding* holding(const std::string& ticker) const;

  const std::vector<domain::Transaction>& ledger() const { return ledger_; }
  const std::vector<DividendRecord>& dividends() const { return dividends_; }
  const std::vector<Snapshot>& snapshots() const { return snapshots_; }

 private:
  void applyBuy(const domain::Transaction& tx);
  void applySell(const domain::Transaction& tx);

  double cash_{0.0};
  Timestamp current_time_{};
  double realized_pnl_{0.0};
  double total_commission_{0.0};

  std::map<std::string, domain::Holding> holdings_;
  std::vector<domain::Transaction> ledger_;
  std::vector<DividendRecord> dividends_;
  std::vector<Snapshot> snapshots_;
};

}  // namespace backtest
