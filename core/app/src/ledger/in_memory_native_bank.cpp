#include "tokensale/ledger/in_memory_native_bank.hpp"

#include <utility>

namespace tokensale {

using domain::Address;
using domain::Amount;

Amount InMemoryNativeBank::balanceOf(const Address& account) const {
  std::lock_guard lock(mutex_);
  auto it = balances_.find(account);
  return it == balances_.end() ? Amount{0} : it->second;
}

bool InMemoryNativeBank::transfer(const Address& from, const Address& to,
                                  const Amount& amount) {
  std::lock_guard lock(mutex_);
  if (domain::isZeroAddress(from) || domain::isZeroAddress(to)) {
    return false;
  }
  Amount& source = balances_[from];
  if (source < amount) {
    return false;
  }
  if (from == to) {
    return true;
  }
  Amount& target = balances_[to];
  const Amount new_target = target + amount;
  journal(from, source);
  journal(to, target);
  source -= amount;
  target = new_target;
  return true;
}

void InMemoryNativeBank::setBalance(const Address& account,
                                    const Amount& amount) {
  std::lock_guard lock(mutex_);
  balances_[account] = amount;
}

void InMemoryNativeBank::begin() {
  std::lock_guard lock(mutex_);
  if (frames_.empty()) {
    frame_owner_ = std::this_thread::get_id();
  }
  frames_.emplace_back();
}

void InMemoryNativeBank::commit() noexcept {
  std::lock_guard lock(mutex_);
  if (frames_.empty()) {
    return;
  }
  auto innermost = std::move(frames_.back());
  frames_.pop_back();
  if (frames_.empty()) {
    frame_owner_ = std::thread::id{};
    return;
  }
  for (auto& entry : innermost) {
    frames_.back().push_back(std::move(entry));
  }
}

void InMemoryNativeBank::rollback() noexcept {
  std::lock_guard lock(mutex_);
  if (frames_.empty()) {
    return;
  }
  const auto& frame = frames_.back();
  for (auto it = frame.rbegin(); it != frame.rend(); ++it) {
    balances_.find(it->account)->second = it->previous;
  }
  frames_.pop_back();
  if (frames_.empty()) {
    frame_owner_ = std::thread::id{};
  }
}

// Caller holds mutex_; the account's map node already exists.
void InMemoryNativeBank::journal(const Address& account,
                                 const Amount& previous) {
  if (frames_.empty() || frame_owner_ != std::this_thread::get_id()) {
    return;
  }
  frames_.back().push_back(UndoEntry{account, previous});
}

}  // namespace tokensale
