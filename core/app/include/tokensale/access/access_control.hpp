#pragma once

#include "tokensale/domain/amount.hpp"

#include <shared_mutex>

namespace tokensale {

class UnitOfWork;

// -----------------------------------------------------------------------------
// AccessControl — the single administrator identity
// -----------------------------------------------------------------------------
//
// @brief  Holds the one address allowed to create and mutate sales, repoint
//         the accepted currencies and oracle, sweep stray balances, and hand
//         the role over.
//
// @details
// Every mutating admin operation calls requireOwner() first and nothing
// else; there is no per-operation permission table. An unauthorized call
// throws AuthorizationError before any state is touched.
//
// The administrator address is also where purchase payments are sent.
//
// Thread model:
//   owner() / requireOwner() take a shared lock; transferOwnership() takes an
//   exclusive lock. Callers mutate only under the engine's ReentrancyGuard.
// -----------------------------------------------------------------------------
class AccessControl {
 public:
  // @throws ValidationError if initial_owner is the zero address.
  explicit AccessControl(domain::Address initial_owner);

  AccessControl(const AccessControl&) = delete;
  AccessControl& operator=(const AccessControl&) = delete;

  domain::Address owner() const;

  bool isOwner(const domain::Address& account) const;

  // -------------------------------------------------------------------------
  // requireOwner
  // -------------------------------------------------------------------------
  // @param  caller     Address attempting the operation.
  // @param  operation  Operation name, used in the error message.
  //
  // @throws AuthorizationError if caller is not the administrator.
  // -------------------------------------------------------------------------
  void requireOwner(const domain::Address& caller, const char* operation) const;

  // -------------------------------------------------------------------------
  // transferOwnership
  // -------------------------------------------------------------------------
  // @brief  Hands the administrator role to new_owner and queues an
  //         OwnershipTransferred notification on uow.
  //
  // @throws AuthorizationError if caller is not the administrator.
  //         ValidationError    if new_owner is the zero address.
  // -------------------------------------------------------------------------
  void transferOwnership(const domain::Address& caller,
                         const domain::Address& new_owner, UnitOfWork& uow);

 private:
  mutable std::shared_mutex mutex_;
  domain::Address owner_;
};

}  // namespace tokensale
