#include "tokensale/ledger/contract_directory.hpp"

#include "tokensale/errors/sale_error.hpp"
#include "tokensale/ledger/unit_of_work.hpp"

#include <mutex>
#include <utility>

namespace tokensale {

using domain::Address;

void ContractDirectory::registerToken(const Address& address,
                                      std::shared_ptr<IAssetToken> token) {
  if (domain::isZeroAddress(address) || !token) {
    throw ValidationError("token registration needs an address and a token");
  }
  TokenEntry entry;
  entry.mintable = std::dynamic_pointer_cast<IMintableToken>(token);
  entry.participant = std::dynamic_pointer_cast<ITransactionParticipant>(token);
  entry.token = std::move(token);

  std::unique_lock lock(mutex_);
  tokens_[address] = std::move(entry);
}

void ContractDirectory::registerPriceFeed(const Address& address,
                                          std::shared_ptr<IPriceFeed> feed) {
  if (domain::isZeroAddress(address) || !feed) {
    throw ValidationError("price feed registration needs an address and a feed");
  }
  std::unique_lock lock(mutex_);
  feeds_[address] = std::move(feed);
}

void ContractDirectory::setNativeBank(std::shared_ptr<INativeBank> bank) {
  std::unique_lock lock(mutex_);
  native_participant_ = std::dynamic_pointer_cast<ITransactionParticipant>(bank);
  native_bank_ = std::move(bank);
}

std::shared_ptr<IAssetToken> ContractDirectory::token(
    const Address& address) const {
  std::shared_lock lock(mutex_);
  auto it = tokens_.find(address);
  return it == tokens_.end() ? nullptr : it->second.token;
}

std::shared_ptr<IMintableToken> ContractDirectory::mintable(
    const Address& address) const {
  std::shared_lock lock(mutex_);
  auto it = tokens_.find(address);
  return it == tokens_.end() ? nullptr : it->second.mintable;
}

std::shared_ptr<IPriceFeed> ContractDirectory::priceFeed(
    const Address& address) const {
  std::shared_lock lock(mutex_);
  auto it = feeds_.find(address);
  return it == feeds_.end() ? nullptr : it->second;
}

std::shared_ptr<INativeBank> ContractDirectory::nativeBank() const {
  std::shared_lock lock(mutex_);
  return native_bank_;
}

void ContractDirectory::enlist(UnitOfWork& uow, const Address& address) const {
  std::shared_ptr<ITransactionParticipant> participant;
  {
    std::shared_lock lock(mutex_);
    auto it = tokens_.find(address);
    if (it != tokens_.end()) {
      participant = it->second.participant;
    }
  }
  if (participant) {
    uow.enlist(*participant);
  }
}

void ContractDirectory::enlistNativeBank(UnitOfWork& uow) const {
  std::shared_ptr<ITransactionParticipant> participant;
  {
    std::shared_lock lock(mutex_);
    participant = native_participant_;
  }
  if (participant) {
    uow.enlist(*participant);
  }
}

std::vector<Address> ContractDirectory::tokenAddresses() const {
  std::shared_lock lock(mutex_);
  std::vector<Address> out;
  out.reserve(tokens_.size());
  for (const auto& [address, entry] : tokens_) {
    out.push_back(address);
  }
  return out;
}

}  // namespace tokensale
