#include "tokensale/ledger/in_memory_token.hpp"

#include <utility>

namespace tokensale {

using domain::Address;
using domain::Amount;

InMemoryToken::InMemoryToken(std::string symbol, unsigned decimals,
                             bool mintable)
    : symbol_(std::move(symbol)), decimals_(decimals), mintable_(mintable) {}

// -----------------------------------------------------------------------------
// Reads
// -----------------------------------------------------------------------------
Amount InMemoryToken::balanceOf(const Address& account) const {
  std::lock_guard lock(mutex_);
  auto it = balances_.find(account);
  return it == balances_.end() ? Amount{0} : it->second;
}

Amount InMemoryToken::allowance(const Address& owner,
                                const Address& spender) const {
  std::lock_guard lock(mutex_);
  auto it = allowances_.find({owner, spender});
  return it == allowances_.end() ? Amount{0} : it->second;
}

Amount InMemoryToken::totalSupply() const {
  std::lock_guard lock(mutex_);
  return total_supply_;
}

bool InMemoryToken::isMinter(const Address& account) const {
  std::lock_guard lock(mutex_);
  return minters_.count(account) != 0;
}

// -----------------------------------------------------------------------------
// Mutations
// -----------------------------------------------------------------------------
bool InMemoryToken::transfer(const Address& caller, const Address& to,
                             const Amount& amount) {
  std::lock_guard lock(mutex_);
  return move(caller, to, amount);
}

bool InMemoryToken::transferFrom(const Address& spender, const Address& from,
                                 const Address& to, const Amount& amount) {
  std::lock_guard lock(mutex_);
  if (domain::isZeroAddress(spender)) {
    return false;
  }
  Amount& approved = allowanceSlot(from, spender);
  if (approved < amount) {
    return false;
  }
  const Amount before = approved;
  if (!move(from, to, amount)) {
    return false;
  }
  journal(Slot::Allowance, from, spender, before);
  approved -= amount;
  return true;
}

bool InMemoryToken::approve(const Address& owner, const Address& spender,
                            const Amount& amount) {
  std::lock_guard lock(mutex_);
  if (domain::isZeroAddress(owner) || domain::isZeroAddress(spender)) {
    return false;
  }
  Amount& slot = allowanceSlot(owner, spender);
  journal(Slot::Allowance, owner, spender, slot);
  slot = amount;
  return true;
}

bool InMemoryToken::mint(const Address& caller, const Address& recipient,
                         const Amount& amount) {
  std::lock_guard lock(mutex_);
  if (!mintable_ || minters_.count(caller) == 0 ||
      domain::isZeroAddress(recipient)) {
    return false;
  }
  Amount& balance = balanceSlot(recipient);
  const Amount new_supply = total_supply_ + amount;
  const Amount new_balance = balance + amount;
  journal(Slot::Supply, Address{}, Address{}, total_supply_);
  journal(Slot::Balance, recipient, Address{}, balance);
  total_supply_ = new_supply;
  balance = new_balance;
  return true;
}

void InMemoryToken::addMinter(const Address& minter) {
  std::lock_guard lock(mutex_);
  minters_.insert(minter);
}

void InMemoryToken::setBalance(const Address& account, const Amount& amount) {
  std::lock_guard lock(mutex_);
  Amount& balance = balanceSlot(account);
  total_supply_ -= balance;
  total_supply_ += amount;
  balance = amount;
}

// -----------------------------------------------------------------------------
// Transaction frames
// -----------------------------------------------------------------------------
void InMemoryToken::begin() {
  std::lock_guard lock(mutex_);
  if (frames_.empty()) {
    frame_owner_ = std::this_thread::get_id();
  }
  frames_.emplace_back();
}

void InMemoryToken::commit() noexcept {
  std::lock_guard lock(mutex_);
  if (frames_.empty()) {
    return;
  }
  auto innermost = std::move(frames_.back());
  frames_.pop_back();
  if (!frames_.empty()) {
    auto& parent = frames_.back();
    for (auto& entry : innermost) {
      parent.push_back(std::move(entry));
    }
  } else {
    frame_owner_ = std::thread::id{};
  }
}

void InMemoryToken::rollback() noexcept {
  std::lock_guard lock(mutex_);
  if (frames_.empty()) {
    return;
  }
  auto& frame = frames_.back();
  for (auto it = frame.rbegin(); it != frame.rend(); ++it) {
    switch (it->slot) {
      case Slot::Balance:
        balances_.find(it->owner)->second = it->previous;
        break;
      case Slot::Allowance:
        allowances_.find({it->owner, it->spender})->second = it->previous;
        break;
      case Slot::Supply:
        total_supply_ = it->previous;
        break;
    }
  }
  frames_.pop_back();
  if (frames_.empty()) {
    frame_owner_ = std::thread::id{};
  }
}

// -----------------------------------------------------------------------------
// Private helpers (mutex_ held)
// -----------------------------------------------------------------------------
Amount& InMemoryToken::balanceSlot(const Address& account) {
  return balances_[account];
}

Amount& InMemoryToken::allowanceSlot(const Address& owner,
                                     const Address& spender) {
  return allowances_[{owner, spender}];
}

// Slots are created before they are journaled, so rollback() only ever
// assigns to existing map nodes.
void InMemoryToken::journal(Slot slot, const Address& owner,
                            const Address& spender, const Amount& previous) {
  if (frames_.empty() || frame_owner_ != std::this_thread::get_id()) {
    return;
  }
  frames_.back().push_back(UndoEntry{slot, owner, spender, previous});
}

bool InMemoryToken::move(const Address& from, const Address& to,
                         const Amount& amount) {
  if (domain::isZeroAddress(from) || domain::isZeroAddress(to)) {
    return false;
  }
  Amount& source = balanceSlot(from);
  if (source < amount) {
    return false;
  }
  if (from == to) {
    return true;
  }
  Amount& target = balanceSlot(to);
  const Amount new_target = target + amount;
  journal(Slot::Balance, from, Address{}, source);
  journal(Slot::Balance, to, Address{}, target);
  source -= amount;
  target = new_target;
  return true;
}

}  // namespace tokensale
