#include "tokensale/purchase/payment_settings.hpp"

#include "tokensale/access/access_control.hpp"
#include "tokensale/ledger/unit_of_work.hpp"

#include <mutex>
#include <utility>

namespace tokensale {

const char* stableSlotToString(StableSlot slot) {
  switch (slot) {
    case StableSlot::A: return "A";
    case StableSlot::B: return "B";
  }
  return "Unknown";
}

PaymentSettings::PaymentSettings(const AccessControl& access,
                                 PaymentSettingsSnapshot initial)
    : access_(access), settings_(std::move(initial)) {}

PaymentSettingsSnapshot PaymentSettings::snapshot() const {
  std::shared_lock lock(mutex_);
  return settings_;
}

domain::Address PaymentSettings::stablecoin(StableSlot slot) const {
  std::shared_lock lock(mutex_);
  return slot == StableSlot::A ? settings_.stablecoin_a
                               : settings_.stablecoin_b;
}

domain::Address PaymentSettings::priceOracle() const {
  std::shared_lock lock(mutex_);
  return settings_.price_oracle;
}

bool PaymentSettings::isAccepted(const domain::Address& token) const {
  if (domain::isZeroAddress(token)) {
    return false;
  }
  std::shared_lock lock(mutex_);
  return token == settings_.stablecoin_a || token == settings_.stablecoin_b;
}

void PaymentSettings::setStablecoin(const domain::Address& caller,
                                    StableSlot slot,
                                    const domain::Address& token,
                                    UnitOfWork& uow) {
  access_.requireOwner(caller, "setStablecoin");
  {
    std::unique_lock lock(mutex_);
    (slot == StableSlot::A ? settings_.stablecoin_a : settings_.stablecoin_b) =
        token;
  }

  PaymentSettingsUpdatedEvent event;
  event.setting = slot == StableSlot::A ? "stablecoin_a" : "stablecoin_b";
  event.address = token;
  uow.emit(std::move(event));
}

void PaymentSettings::setPriceOracle(const domain::Address& caller,
                                     const domain::Address& feed,
                                     UnitOfWork& uow) {
  access_.requireOwner(caller, "setPriceOracle");
  {
    std::unique_lock lock(mutex_);
    settings_.price_oracle = feed;
  }

  PaymentSettingsUpdatedEvent event;
  event.setting = "price_oracle";
  event.address = feed;
  uow.emit(std::move(event));
}

}  // namespace tokensale
