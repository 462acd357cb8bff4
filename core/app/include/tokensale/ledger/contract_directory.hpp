#pragma once

#include "tokensale/domain/amount.hpp"
#include "tokensale/ledger/i_asset_token.hpp"
#include "tokensale/ledger/i_native_bank.hpp"
#include "tokensale/ledger/i_transaction_participant.hpp"
#include "tokensale/oracle/i_price_feed.hpp"

#include <map>
#include <memory>
#include <shared_mutex>
#include <vector>

namespace tokensale {

class UnitOfWork;

// -----------------------------------------------------------------------------
// ContractDirectory — address -> collaborator resolution
// -----------------------------------------------------------------------------
//
// @brief  Maps the addresses stored in sales and payment settings onto the
//         collaborator objects that implement them.
//
// @details
// A sale stores only its asset's address, and the payment settings store
// only addresses. The purchase path resolves them here at call time, so an
// administrator repointing a slot takes effect on the next purchase.
//
// registerToken() also records, through dynamic_pointer_cast, whether the
// token exposes a mint entrypoint and whether it can take part in a unit of
// work. enlist() uses the latter to put a touched token under the current
// transaction before it is called.
//
// Thread model:
//   Registration takes an exclusive lock, lookups a shared lock. Returned
//   shared_ptrs keep the collaborator alive across the call.
// -----------------------------------------------------------------------------
class ContractDirectory {
 public:
  ContractDirectory() = default;

  ContractDirectory(const ContractDirectory&) = delete;
  ContractDirectory& operator=(const ContractDirectory&) = delete;

  void registerToken(const domain::Address& address,
                     std::shared_ptr<IAssetToken> token);

  void registerPriceFeed(const domain::Address& address,
                         std::shared_ptr<IPriceFeed> feed);

  void setNativeBank(std::shared_ptr<INativeBank> bank);

  // nullptr when nothing is registered at the address.
  std::shared_ptr<IAssetToken> token(const domain::Address& address) const;
  std::shared_ptr<IMintableToken> mintable(
      const domain::Address& address) const;
  std::shared_ptr<IPriceFeed> priceFeed(const domain::Address& address) const;
  std::shared_ptr<INativeBank> nativeBank() const;

  // Enlists the token at address in uow if it is a transaction participant.
  void enlist(UnitOfWork& uow, const domain::Address& address) const;

  // Enlists the native bank in uow if it is a transaction participant.
  void enlistNativeBank(UnitOfWork& uow) const;

  std::vector<domain::Address> tokenAddresses() const;

 private:
  struct TokenEntry {
    std::shared_ptr<IAssetToken> token;
    std::shared_ptr<IMintableToken> mintable;
    std::shared_ptr<ITransactionParticipant> participant;
  };

  mutable std::shared_mutex mutex_;
  std::map<domain::Address, TokenEntry> tokens_;
  std::map<domain::Address, std::shared_ptr<IPriceFeed>> feeds_;
  std::shared_ptr<INativeBank> native_bank_;
  std::shared_ptr<ITransactionParticipant> native_participant_;
};

}  // namespace tokensale
