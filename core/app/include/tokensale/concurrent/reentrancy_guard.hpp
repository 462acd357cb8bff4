#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <thread>

namespace tokensale {

// -----------------------------------------------------------------------------
// ReentrancyGuard — the system-wide operation lock
// -----------------------------------------------------------------------------
//
// @brief  Serializes every purchase and every admin mutation, and rejects a
//         re-entrant acquisition instead of deadlocking on it.
//
// @details
// A purchase reads tokens_sold, computes the cap headroom, calls out to the
// asset (transfer / transferFrom / mint), the payment token and the price
// feed, and only then writes tokens_sold back. All of those collaborators are
// externally owned code. If one of them called back into the purchase path
// while the first purchase was still in flight, the nested call would see the
// stale tokens_sold and could sell past the cap.
//
// Two cases, told apart by the owning thread id:
//
//   - Another thread holds the guard:  block on mutex_ until it is released.
//     Concurrent buyers are therefore serialized, never rejected.
//   - The calling thread holds it:     throw ReentrancyError immediately. The
//     nested call fails fast; its exception unwinds through the collaborator
//     and aborts the outer operation, whose UnitOfWork rolls everything back.
//
// Thread model:
//   Scope may be constructed on any thread. owner_ is atomic so the
//   same-thread check does not need mutex_.
//
// Ownership:
//   Value member of SaleEngine; PurchaseEngine and the admin paths hold a
//   reference.
// -----------------------------------------------------------------------------
class ReentrancyGuard {
 public:
  ReentrancyGuard() = default;

  ReentrancyGuard(const ReentrancyGuard&) = delete;
  ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;
  ReentrancyGuard(ReentrancyGuard&&) = delete;
  ReentrancyGuard& operator=(ReentrancyGuard&&) = delete;

  // -------------------------------------------------------------------------
  // Scope — RAII acquisition
  // -------------------------------------------------------------------------
  //
  // @brief  Acquires the guard for the lifetime of the object.
  //
  // @param  guard      The guard to acquire.
  // @param  operation  Name used in the ReentrancyError message.
  //
  // @throws ReentrancyError if the calling thread already holds the guard.
  //
  // Side-effects: may block while another thread holds the guard. Releases
  //               on destruction, including during exception unwinding.
  // -------------------------------------------------------------------------
  class Scope {
   public:
    Scope(ReentrancyGuard& guard, const char* operation);
    ~Scope();

    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

   private:
    ReentrancyGuard& guard_;
  };

  // True while any thread is inside a Scope. Diagnostic only.
  bool isHeld() const;

  // True while the calling thread is inside a Scope.
  bool isHeldByCurrentThread() const;

 private:
  std::mutex mutex_;
  std::atomic<std::thread::id> owner_{};
};

}  // namespace tokensale
