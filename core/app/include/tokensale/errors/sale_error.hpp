#pragma once

#include <stdexcept>
#include <string>

namespace tokensale {

// -----------------------------------------------------------------------------
// ErrorKind — failure taxonomy shared by every operation
// -----------------------------------------------------------------------------
//
// @brief  Classifies why an operation was aborted.
//
// @details
// Every failure aborts the whole enclosing operation; the UnitOfWork rolls
// back all effects before the exception leaves the engine. Callers (the IPC
// layer, tests) switch on kind() rather than parsing what().
//
//   Validation           zero / malformed amount, unknown currency, bad
//                        disbursement configuration, arithmetic overflow
//   Authorization        non-administrator attempted an admin mutation
//   State                sale paused, not started yet, or already ended
//   InsufficientAllowance buyer has not approved enough payment
//   CapacityExceeded     purchase would push tokensSold past the cap
//   Oracle               price feed missing or answered <= 0
//   TransferFailure      a token pull / push / mint / native move failed
//   NotFound             sale index out of range
//   Reentrancy           operation lock already held by the calling thread
// -----------------------------------------------------------------------------
enum class ErrorKind {
  Validation,
  Authorization,
  State,
  InsufficientAllowance,
  CapacityExceeded,
  Oracle,
  TransferFailure,
  NotFound,
  Reentrancy,
};

// Stable name used in logs and IPC replies ("CapacityExceeded", ...).
const char* errorKindToString(ErrorKind kind);

// -----------------------------------------------------------------------------
// SaleError — root of the typed failure hierarchy
// -----------------------------------------------------------------------------
class SaleError : public std::runtime_error {
 public:
  SaleError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

// One subclass per kind so call sites and tests can catch precisely.
#define TOKENSALE_DECLARE_ERROR(Name, Kind)                              \
  class Name : public SaleError {                                       \
   public:                                                              \
    explicit Name(const std::string& message)                           \
        : SaleError(ErrorKind::Kind, message) {}                        \
  }

TOKENSALE_DECLARE_ERROR(ValidationError, Validation);
TOKENSALE_DECLARE_ERROR(AuthorizationError, Authorization);
TOKENSALE_DECLARE_ERROR(StateError, State);
TOKENSALE_DECLARE_ERROR(InsufficientAllowanceError, InsufficientAllowance);
TOKENSALE_DECLARE_ERROR(CapacityExceededError, CapacityExceeded);
TOKENSALE_DECLARE_ERROR(OracleError, Oracle);
TOKENSALE_DECLARE_ERROR(TransferFailureError, TransferFailure);
TOKENSALE_DECLARE_ERROR(NotFoundError, NotFound);
TOKENSALE_DECLARE_ERROR(ReentrancyError, Reentrancy);

#undef TOKENSALE_DECLARE_ERROR

}  // namespace tokensale
