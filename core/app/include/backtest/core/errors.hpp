#pragma once

#include <stdexcept>
#include <string>

namespace backtest {

// -----------------------------------------------------------------------------
// Error hierarchy
// -----------------------------------------------------------------------------
//
// @brief  Every error raised by the engine derives from BacktestError so that
//         main() can report failures with a single catch clause.
//
// @details
// Two families matter to the simulation loop:
//
//   ContractViolation — the caller broke an operation's preconditions
//                       (negative cash amount, negative price, malformed
//                       event). These propagate; the engine never swallows
//                       them.
//
//   DomainRejection   — the operation is well-formed but cannot happen in the
//                       current state (insufficient funds, selling a ticker
//                       that is not held). The Backtester logs these, drops
//                       the offending event and keeps running.
//
// ConfigError and DataError wrap failures while loading run configuration and
// historical data files.
// -----------------------------------------------------------------------------
class BacktestError : public std::runtime_error {
 public:
  explicit BacktestError(const std::string& msg) : std::runtime_error(msg) {}
};

class ContractViolation : public BacktestError {
 public:
  explicit ContractViolation(const std::string& msg)
      : BacktestError("Contract violation: " + msg) {}
};

// Raised by EventQueue::push() for a value that does not hold an event.
class TypeContractError : public ContractViolation {
 public:
  explicit TypeContractError(const std::string& msg) : ContractViolation(msg) {}
};

class DomainRejection : public BacktestError {
 public:
  explicit DomainRejection(const std::string& msg) : BacktestError(msg) {}
};

class InsufficientFundsError : public DomainRejection {
 public:
  explicit InsufficientFundsError(const std::string& msg)
      : DomainRejection("Insufficient funds: " + msg) {}
};

class InsufficientPositionError : public DomainRejection {
 public:
  explicit InsufficientPositionError(const std::string& msg)
      : DomainRejection("Insufficient position: " + msg) {}
};

class NotHeldError : public DomainRejection {
 public:
  explicit NotHeldError(const std::string& msg)
      : DomainRejection("Not held: " + msg) {}
};

class UnknownTransactionTypeError : public DomainRejection {
 public:
  explicit UnknownTransactionTypeError(const std::string& msg)
      : DomainRejection("Unknown transaction type: " + msg) {}
};

class ConfigError : public BacktestError {
 public:
  explicit ConfigError(const std::string& msg)
      : BacktestError("Config error: " + msg) {}
};

class DataError : public BacktestError {
 public:
  explicit DataError(const std::string& msg)
      : BacktestError("Data error: " + msg) {}
};

}  // namespace backtest
