#include "tokensale/access/access_control.hpp"

#include "tokensale/errors/sale_error.hpp"
#include "tokensale/ledger/unit_of_work.hpp"

#include <mutex>
#include <utility>

namespace tokensale {

AccessControl::AccessControl(domain::Address initial_owner)
    : owner_(std::move(initial_owner)) {
  if (domain::isZeroAddress(owner_)) {
    throw ValidationError("administrator address must not be empty");
  }
}

domain::Address AccessControl::owner() const {
  std::shared_lock lock(mutex_);
  return owner_;
}

bool AccessControl::isOwner(const domain::Address& account) const {
  std::shared_lock lock(mutex_);
  return !domain::isZeroAddress(account) && account == owner_;
}

void AccessControl::requireOwner(const domain::Address& caller,
                                 const char* operation) const {
  if (!isOwner(caller)) {
    throw AuthorizationError(std::string(operation) + ": caller '" + caller +
                             "' is not the administrator");
  }
}

void AccessControl::transferOwnership(const domain::Address& caller,
                                      const domain::Address& new_owner,
                                      UnitOfWork& uow) {
  requireOwner(caller, "transferOwnership");
  if (domain::isZeroAddress(new_owner)) {
    throw ValidationError("transferOwnership: new owner must not be empty");
  }

  domain::Address previous;
  {
    std::unique_lock lock(mutex_);
    previous = std::exchange(owner_, new_owner);
  }

  OwnershipTransferredEvent event;
  event.previous_owner = std::move(previous);
  event.new_owner = new_owner;
  uow.emit(std::move(event));
}

}  // namespace tokensale
