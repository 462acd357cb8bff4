#pragma once

#include "tokensale/domain/amount.hpp"
#include "tokensale/domain/sale.hpp"
#include "tokensale/events/sale_events.hpp"

#include <string>

namespace tokensale {

class AccessControl;
class ContractDirectory;
class DisbursementStrategy;
class EventBus;
class ITimeProvider;
class PaymentSettings;
class PriceOracleAdapter;
class ReentrancyGuard;
class SaleRegistry;
class SequenceGenerator;
class UnitOfWork;

// -----------------------------------------------------------------------------
// PurchaseEngine — the two purchase entry points
// -----------------------------------------------------------------------------
//
// @brief  Turns a stablecoin payment or an attached native-currency payment
//         into disbursed sale units, as one indivisible operation.
//
// @details
// Both entry points follow the same frame:
//
//   ReentrancyGuard::Scope        (nested call from a collaborator fails fast)
//   UnitOfWork                    (registry, pay token, asset, native bank)
//     checks -> conversion -> cap -> payment -> disburse -> recordSold
//     emit TokensBought
//     commit
//   release guard
//   EventBus::publishAll          (subscribers may call back in)
//
// Any exception unwinds the UnitOfWork first, so every balance, allowance
// and tokens_sold value is back to its pre-call state before the error
// reaches the caller. A rejected purchase logs one line to std::cerr.
//
// buyWithStable order:
//   1. pay_token must be a configured accepted stablecoin   ValidationError
//   2. sale lookup                                          NotFoundError
//   3. sale active at clock.now_s()                         StateError
//   4. amount != 0                                          ValidationError
//   5. usd_cost = floor(amount * price / 10^18) != 0        ValidationError
//   6. amount <= cap - sold (when capped)                   CapacityExceeded
//   7. allowance(buyer -> sale_address) >= usd_cost         InsufficientAllowance
//   8. pay_token.transferFrom(buyer -> administrator)       TransferFailure
//   9. disburse, recordSold, emit
//
// buyWithNative order:
//   1. sale lookup, 2. active, 3. native_sent != 0, 4. oracle rate,
//   5. usd_value = floor(native_sent * rate / 10^8),
//   6. amount = floor(usd_value * 10^6 / price) != 0,  7. cap,
//   8. native buyer -> sale_address -> administrator,   9. disburse, record,
//   emit.
//
// Thread model:
//   Callable from any thread. The guard serializes purchases with each other
//   and with every admin mutation.
// -----------------------------------------------------------------------------
class PurchaseEngine {
 public:
  PurchaseEngine(SaleRegistry& registry,
                 const PaymentSettings& settings,
                 const AccessControl& access,
                 const PriceOracleAdapter& oracle,
                 const DisbursementStrategy& disbursement,
                 const ContractDirectory& directory,
                 ReentrancyGuard& guard,
                 SequenceGenerator& sequence,
                 const ITimeProvider& clock,
                 EventBus& bus);

  PurchaseEngine(const PurchaseEngine&) = delete;
  PurchaseEngine& operator=(const PurchaseEngine&) = delete;

  // @return The published TokensBought notification.
  TokensBoughtEvent buyWithStable(const domain::Address& buyer,
                                  domain::SaleIndex sale_index,
                                  const domain::Address& pay_token,
                                  const domain::Amount& amount_to_buy,
                                  const std::string& referral_code);

  // @return The published TokensBought notification.
  TokensBoughtEvent buyWithNative(const domain::Address& buyer,
                                  domain::SaleIndex sale_index,
                                  const domain::Amount& native_sent,
                                  const std::string& referral_code);

 private:
  // Guard + unit of work + log-on-failure + publish-after-release.
  template <typename Body>
  TokensBoughtEvent execute(const char* operation, Body&& body);

  // Steps shared by both entry points once the payment has been taken.
  void settle(UnitOfWork& uow, const domain::Sale& sale,
              const domain::Address& buyer, TokensBoughtEvent event);

  domain::Sale activeSale(domain::SaleIndex sale_index) const;
  static void requireCapacity(const domain::Sale& sale,
                              const domain::Amount& amount);

  SaleRegistry& registry_;
  const PaymentSettings& settings_;
  const AccessControl& access_;
  const PriceOracleAdapter& oracle_;
  const DisbursementStrategy& disbursement_;
  const ContractDirectory& directory_;
  ReentrancyGuard& guard_;
  SequenceGenerator& sequence_;
  const ITimeProvider& clock_;
  EventBus& bus_;
};

}  // namespace tokensale
