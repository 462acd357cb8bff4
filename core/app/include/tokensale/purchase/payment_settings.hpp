#pragma once

#include "tokensale/domain/amount.hpp"

#include <shared_mutex>

namespace tokensale {

class AccessControl;
class UnitOfWork;

// Which of the two accepted stablecoin slots an operation refers to.
enum class StableSlot { A, B };

const char* stableSlotToString(StableSlot slot);

// -----------------------------------------------------------------------------
// PaymentSettingsSnapshot — consistent copy of all three references
// -----------------------------------------------------------------------------
struct PaymentSettingsSnapshot {
  domain::Address stablecoin_a;
  domain::Address stablecoin_b;
  domain::Address price_oracle;
};

// -----------------------------------------------------------------------------
// PaymentSettings — accepted currencies and the oracle reference
// -----------------------------------------------------------------------------
//
// @brief  The two accepted stablecoin addresses and the price-feed address.
//         Each may be empty (unconfigured).
//
// @details
// Administrator writes only, gated through AccessControl. Every setter queues
// a PaymentSettingsUpdated notification on the caller's unit of work.
// Purchases read the slots at call time.
//
// Thread model:
//   Readers take a shared lock and see the state left by the last completed
//   write; setters take an exclusive lock.
// -----------------------------------------------------------------------------
class PaymentSettings {
 public:
  PaymentSettings(const AccessControl& access, PaymentSettingsSnapshot initial);

  PaymentSettings(const PaymentSettings&) = delete;
  PaymentSettings& operator=(const PaymentSettings&) = delete;

  PaymentSettingsSnapshot snapshot() const;

  domain::Address stablecoin(StableSlot slot) const;
  domain::Address priceOracle() const;

  // True only for a non-empty address equal to slot A or slot B.
  bool isAccepted(const domain::Address& token) const;

  // @throws AuthorizationError if caller is not the administrator.
  void setStablecoin(const domain::Address& caller, StableSlot slot,
                     const domain::Address& token, UnitOfWork& uow);

  // @throws AuthorizationError if caller is not the administrator.
  void setPriceOracle(const domain::Address& caller,
                      const domain::Address& feed, UnitOfWork& uow);

 private:
  const AccessControl& access_;
  mutable std::shared_mutex mutex_;
  PaymentSettingsSnapshot settings_;
};

}  // namespace tokensale
