#pragma once

namespace tokensale {

// -----------------------------------------------------------------------------
// ITransactionParticipant — state that can be rolled back with a unit of work
// -----------------------------------------------------------------------------
//
// @brief  Anything whose mutations must be undone when a purchase or admin
//         mutation fails part-way: the sale registry, token ledgers, the
//         native-currency bank.
//
// @details
// Frames nest. begin() opens a frame; every mutation made while the frame
// is open is journaled into it. commit() closes the innermost frame and
// folds its journal into the parent (or discards it at the outermost level).
// rollback() closes the innermost frame and undoes its journal in reverse.
//
// begin/commit/rollback are called by UnitOfWork only, on the thread that
// runs the operation, under the engine's ReentrancyGuard.
//
// Implementations must make commit() and rollback() non-throwing.
// -----------------------------------------------------------------------------
class ITransactionParticipant {
 public:
  virtual ~ITransactionParticipant() = default;

  virtual void begin() = 0;
  virtual void commit() noexcept = 0;
  virtual void rollback() noexcept = 0;
};

}  // namespace tokensale
