#pragma once

#include "tokensale/domain/amount.hpp"
#include "tokensale/ledger/i_asset_token.hpp"
#include "tokensale/ledger/i_transaction_participant.hpp"

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace tokensale {

// -----------------------------------------------------------------------------
// InMemoryToken — journaled in-process fungible token
// -----------------------------------------------------------------------------
//
// @brief  Simulation of a stablecoin or a sale asset: balances, allowances,
//         total supply, and an optional mint entrypoint restricted to a set
//         of minters.
//
// @details
// Backs the node's simulated ledger and every test. As a transaction
// participant it journals each balance / allowance / supply change made by
// the thread that opened the current frame, so a failed purchase restores
// the exact pre-call balances:
//
//   begin()     push a frame (the outermost begin records the owning thread)
//   mutation    record {slot, key, previous value} into the innermost frame
//   commit()    fold the innermost frame into its parent, or drop it
//   rollback()  replay the innermost frame newest-first, then drop it
//
// Balances set through setBalance() are seeding and never journaled.
//
// Thread model:
//   All public methods take mutex_. Mutations from a thread other than the
//   frame owner apply immediately and are not journaled.
// -----------------------------------------------------------------------------
class InMemoryToken final : public IAssetToken,
                            public IMintableToken,
                            public ITransactionParticipant {
 public:
  explicit InMemoryToken(std::string symbol,
                         unsigned decimals = domain::kAssetDecimals,
                         bool mintable = false);

  InMemoryToken(const InMemoryToken&) = delete;
  InMemoryToken& operator=(const InMemoryToken&) = delete;

  // --- IAssetToken ----------------------------------------------------------
  domain::Amount balanceOf(const domain::Address& account) const override;
  domain::Amount allowance(const domain::Address& owner,
                           const domain::Address& spender) const override;
  unsigned decimals() const override { return decimals_; }

  bool transfer(const domain::Address& caller,
                const domain::Address& to,
                const domain::Amount& amount) override;

  bool transferFrom(const domain::Address& spender,
                    const domain::Address& from,
                    const domain::Address& to,
                    const domain::Amount& amount) override;

  bool approve(const domain::Address& owner,
               const domain::Address& spender,
               const domain::Amount& amount) override;

  // --- IMintableToken -------------------------------------------------------
  // Fails when the token was built non-mintable or caller is not a minter.
  bool mint(const domain::Address& caller,
            const domain::Address& recipient,
            const domain::Amount& amount) override;

  // --- ITransactionParticipant ----------------------------------------------
  void begin() override;
  void commit() noexcept override;
  void rollback() noexcept override;

  // Grants mint rights. Has no effect on a non-mintable token's mint().
  void addMinter(const domain::Address& minter);
  bool isMinter(const domain::Address& account) const;

  // Seeds a balance outside any transaction; adjusts total supply.
  void setBalance(const domain::Address& account, const domain::Amount& amount);

  domain::Amount totalSupply() const;
  const std::string& symbol() const { return symbol_; }
  bool mintable() const { return mintable_; }

 private:
  enum class Slot { Balance, Allowance, Supply };

  struct UndoEntry {
    Slot slot;
    domain::Address owner;
    domain::Address spender;
    domain::Amount previous;
  };

  using AllowanceKey = std::pair<domain::Address, domain::Address>;

  // Helpers below expect mutex_ to be held.
  domain::Amount& balanceSlot(const domain::Address& account);
  domain::Amount& allowanceSlot(const domain::Address& owner,
                                const domain::Address& spender);
  void journal(Slot slot, const domain::Address& owner,
               const domain::Address& spender, const domain::Amount& previous);
  bool move(const domain::Address& from, const domain::Address& to,
            const domain::Amount& amount);

  const std::string symbol_;
  const unsigned decimals_;
  const bool mintable_;

  mutable std::mutex mutex_;
  std::map<domain::Address, domain::Amount> balances_;
  std::map<AllowanceKey, domain::Amount> allowances_;
  domain::Amount total_supply_{0};
  std::set<domain::Address> minters_;

  std::vector<std::vector<UndoEntry>> frames_;
  std::thread::id frame_owner_;
};

}  // namespace tokensale
