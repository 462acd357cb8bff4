#pragma once

#include "tokensale/concurrent/sequence_generator.hpp"
#include "tokensale/events/event.hpp"
#include "tokensale/ledger/i_transaction_participant.hpp"
#include "tokensale/time/i_time_provider.hpp"

#include <vector>

namespace tokensale {

// -----------------------------------------------------------------------------
// UnitOfWork — all-or-nothing boundary around one engine operation
// -----------------------------------------------------------------------------
//
// @brief  RAII transaction spanning every participant an operation touches,
//         plus the notifications the operation wants to raise.
//
// @details
// Usage inside an engine operation:
//
//   std::vector<Event> events;
//   {
//     ReentrancyGuard::Scope scope(guard_, "buyWithStable");
//     UnitOfWork uow(sequence_, clock_);
//     uow.enlist(registry_);
//     ... payment pull, disbursement, recordSold, uow.emit(...) ...
//     events = uow.commit();
//   }
//   bus_.publishAll(events);
//
// enlist() opens a frame on a participant the first time it is seen; later
// enlistments of the same participant are no-ops. If the object is destroyed
// before commit() (an exception is unwinding), every enlisted participant is
// rolled back in reverse enlistment order and the queued notifications are
// dropped.
//
// emit() stamps the event with the next sequence id and the clock's current
// time, then queues it. Nothing is published from inside the unit of work.
//
// Thread model:
//   Single-threaded: lives on the stack of the operation's thread.
//
// Ownership:
//   Holds non-owning pointers to participants; each participant must outlive
//   the UnitOfWork.
// -----------------------------------------------------------------------------
class UnitOfWork {
 public:
  UnitOfWork(SequenceGenerator& sequence, const ITimeProvider& clock);
  ~UnitOfWork();

  UnitOfWork(const UnitOfWork&) = delete;
  UnitOfWork& operator=(const UnitOfWork&) = delete;
  UnitOfWork(UnitOfWork&&) = delete;
  UnitOfWork& operator=(UnitOfWork&&) = delete;

  // Opens a frame on participant unless it is already enlisted.
  void enlist(ITransactionParticipant& participant);

  // Stamps and queues a notification for publication after commit.
  void emit(Event event);

  // -------------------------------------------------------------------------
  // commit()
  // -------------------------------------------------------------------------
  // @brief  Commits every enlisted participant and hands back the queued
  //         notifications in emission order.
  //
  // @details
  // After commit() the destructor does nothing. Calling commit() twice
  // returns an empty vector the second time.
  // -------------------------------------------------------------------------
  std::vector<Event> commit();

  bool committed() const { return committed_; }

 private:
  void rollbackAll() noexcept;

  SequenceGenerator& sequence_;
  const ITimeProvider& clock_;
  std::vector<ITransactionParticipant*> participants_;
  std::vector<Event> pending_;
  bool committed_{false};
};

}  // namespace tokensale
