#include "tokensale/concurrent/reentrancy_guard.hpp"
#include "tokensale/errors/sale_error.hpp"

namespace tokensale {

// -----------------------------------------------------------------------------
// Scope: reject same-thread re-entry, otherwise block until free
// -----------------------------------------------------------------------------
ReentrancyGuard::Scope::Scope(ReentrancyGuard& guard, const char* operation)
    : guard_(guard) {
  if (guard_.owner_.load() == std::this_thread::get_id()) {
    throw ReentrancyError(std::string("re-entrant call rejected: ") +
                          operation);
  }
  guard_.mutex_.lock();
  guard_.owner_.store(std::this_thread::get_id());
}

ReentrancyGuard::Scope::~Scope() {
  // Clear the owner before unlocking so the next holder never observes a
  // stale id.
  guard_.owner_.store(std::thread::id{});
  guard_.mutex_.unlock();
}

bool ReentrancyGuard::isHeld() const {
  return owner_.load() != std::thread::id{};
}

bool ReentrancyGuard::isHeldByCurrentThread() const {
  return owner_.load() == std::this_thread::get_id();
}

}  // namespace tokensale
