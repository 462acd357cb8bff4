#pragma once

#include "tokensale/domain/amount.hpp"
#include "tokensale/ledger/i_native_bank.hpp"
#include "tokensale/ledger/i_transaction_participant.hpp"

#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace tokensale {

// -----------------------------------------------------------------------------
// InMemoryNativeBank — journaled native-currency balances
// -----------------------------------------------------------------------------
// Same frame discipline as InMemoryToken: balance changes made by the frame's
// owning thread are journaled and undone by rollback(). setBalance() seeds
// outside any transaction.
// -----------------------------------------------------------------------------
class InMemoryNativeBank final : public INativeBank,
                                 public ITransactionParticipant {
 public:
  InMemoryNativeBank() = default;

  InMemoryNativeBank(const InMemoryNativeBank&) = delete;
  InMemoryNativeBank& operator=(const InMemoryNativeBank&) = delete;

  domain::Amount balanceOf(const domain::Address& account) const override;

  bool transfer(const domain::Address& from,
                const domain::Address& to,
                const domain::Amount& amount) override;

  void setBalance(const domain::Address& account, const domain::Amount& amount);

  void begin() override;
  void commit() noexcept override;
  void rollback() noexcept override;

 private:
  struct UndoEntry {
    domain::Address account;
    domain::Amount previous;
  };

  void journal(const domain::Address& account, const domain::Amount& previous);

  mutable std::mutex mutex_;
  std::map<domain::Address, domain::Amount> balances_;
  std::vector<std::vector<UndoEntry>> frames_;
  std::thread::id frame_owner_;
};

}  // namespace tokensale
