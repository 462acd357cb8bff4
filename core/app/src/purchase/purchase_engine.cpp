#include "tokensale/purchase/purchase_engine.hpp"

#include "tokensale/access/access_control.hpp"
#include "tokensale/concurrent/reentrancy_guard.hpp"
#include "tokensale/errors/sale_error.hpp"
#include "tokensale/eventbus/event_bus.hpp"
#include "tokensale/ledger/contract_directory.hpp"
#include "tokensale/ledger/unit_of_work.hpp"
#include "tokensale/oracle/price_oracle_adapter.hpp"
#include "tokensale/purchase/payment_settings.hpp"
#include "tokensale/purchase/price_math.hpp"
#include "tokensale/sale/active_sale_guard.hpp"
#include "tokensale/sale/disbursement_strategy.hpp"
#include "tokensale/sale/sale_registry.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tokensale {

using domain::Address;
using domain::Amount;
using domain::Sale;
using domain::SaleIndex;

PurchaseEngine::PurchaseEngine(SaleRegistry& registry,
                               const PaymentSettings& settings,
                               const AccessControl& access,
                               const PriceOracleAdapter& oracle,
                               const DisbursementStrategy& disbursement,
                               const ContractDirectory& directory,
                               ReentrancyGuard& guard,
                               SequenceGenerator& sequence,
                               const ITimeProvider& clock,
                               EventBus& bus)
    : registry_(registry),
      settings_(settings),
      access_(access),
      oracle_(oracle),
      disbursement_(disbursement),
      directory_(directory),
      guard_(guard),
      sequence_(sequence),
      clock_(clock),
      bus_(bus) {}

// -----------------------------------------------------------------------------
// execute(): operation frame shared by both entry points
// -----------------------------------------------------------------------------
// The UnitOfWork is destroyed (and rolled back) before any catch clause runs,
// and the guard is released before publishing.
template <typename Body>
TokensBoughtEvent PurchaseEngine::execute(const char* operation, Body&& body) {
  std::vector<Event> events;
  try {
    ReentrancyGuard::Scope scope(guard_, operation);
    UnitOfWork uow(sequence_, clock_);
    body(uow);
    events = uow.commit();
  } catch (const SaleError& e) {
    std::cerr << "[PurchaseEngine] " << operation << " rejected ("
              << errorKindToString(e.kind()) << "): " << e.what() << "\n";
    throw;
  } catch (const std::overflow_error& e) {
    std::cerr << "[PurchaseEngine] " << operation
              << " rejected (Validation): overflow: " << e.what() << "\n";
    throw ValidationError(std::string(operation) + ": amount overflow");
  } catch (const std::range_error& e) {
    std::cerr << "[PurchaseEngine] " << operation
              << " rejected (Validation): out of range: " << e.what() << "\n";
    throw ValidationError(std::string(operation) + ": amount out of range");
  }

  bus_.publishAll(events);

  for (const auto& event : events) {
    if (const auto* bought = std::get_if<TokensBoughtEvent>(&event)) {
      return *bought;
    }
  }
  return TokensBoughtEvent{};
}

// -----------------------------------------------------------------------------
// buyWithStable()
// -----------------------------------------------------------------------------
TokensBoughtEvent PurchaseEngine::buyWithStable(const Address& buyer,
                                                SaleIndex sale_index,
                                                const Address& pay_token,
                                                const Amount& amount_to_buy,
                                                const std::string& referral_code) {
  return execute("buyWithStable", [&](UnitOfWork& uow) {
    if (!settings_.isAccepted(pay_token)) {
      throw ValidationError("'" + pay_token +
                            "' is not an accepted stablecoin");
    }
    const Sale sale = activeSale(sale_index);

    if (amount_to_buy == 0) {
      throw ValidationError("amount to buy is zero");
    }
    const Amount usd_cost = pricing::usdCost(amount_to_buy, sale.price_in_usd);
    if (usd_cost == 0) {
      throw ValidationError("amount " + domain::formatAmount(amount_to_buy) +
                            " is too small to cost anything");
    }
    requireCapacity(sale, amount_to_buy);

    auto token = directory_.token(pay_token);
    if (!token) {
      throw TransferFailureError("no token registered at '" + pay_token + "'");
    }
    const Address& sale_address = registry_.saleAddress();
    const Amount allowance = token->allowance(buyer, sale_address);
    if (usd_cost > allowance) {
      throw InsufficientAllowanceError(
          "cost " + domain::formatAmount(usd_cost) + " exceeds allowance " +
          domain::formatAmount(allowance));
    }

    directory_.enlist(uow, pay_token);
    if (!token->transferFrom(sale_address, buyer, access_.owner(), usd_cost)) {
      throw TransferFailureError("payment of " +
                                 domain::formatAmount(usd_cost) + " '" +
                                 pay_token + "' from '" + buyer + "' failed");
    }

    TokensBoughtEvent event;
    event.amount_bought = amount_to_buy;
    event.usd_cost = usd_cost;
    event.pay_token = pay_token;
    event.referral_code = referral_code;
    settle(uow, sale, buyer, std::move(event));
  });
}

// -----------------------------------------------------------------------------
// buyWithNative()
// -----------------------------------------------------------------------------
TokensBoughtEvent PurchaseEngine::buyWithNative(const Address& buyer,
                                                SaleIndex sale_index,
                                                const Amount& native_sent,
                                                const std::string& referral_code) {
  return execute("buyWithNative", [&](UnitOfWork& uow) {
    const Sale sale = activeSale(sale_index);

    if (native_sent == 0) {
      throw ValidationError("no native currency attached");
    }
    const Amount rate = oracle_.latestUsdPerNative();
    const Amount usd_value = pricing::usdValueOfNative(native_sent, rate);
    const Amount amount_to_buy =
        pricing::assetAmountForUsd(usd_value, sale.price_in_usd);
    if (amount_to_buy == 0) {
      throw ValidationError("payment of " + domain::formatAmount(native_sent) +
                            " buys nothing at the current rate");
    }
    requireCapacity(sale, amount_to_buy);

    auto bank = directory_.nativeBank();
    if (!bank) {
      throw TransferFailureError("no native currency bank configured");
    }
    directory_.enlistNativeBank(uow);
    const Address& sale_address = registry_.saleAddress();
    if (!bank->transfer(buyer, sale_address, native_sent)) {
      throw TransferFailureError("'" + buyer + "' cannot pay " +
                                 domain::formatAmount(native_sent));
    }
    if (!bank->transfer(sale_address, access_.owner(), native_sent)) {
      throw TransferFailureError("forwarding " +
                                 domain::formatAmount(native_sent) +
                                 " to the administrator failed");
    }

    TokensBoughtEvent event;
    event.amount_bought = amount_to_buy;
    event.native_sent = native_sent;
    event.referral_code = referral_code;
    settle(uow, sale, buyer, std::move(event));
  });
}

// -----------------------------------------------------------------------------
// settle(): disburse, book, queue TokensBought
// -----------------------------------------------------------------------------
void PurchaseEngine::settle(UnitOfWork& uow, const Sale& sale,
                            const Address& buyer, TokensBoughtEvent event) {
  disbursement_.disburse(sale, buyer, event.amount_bought, uow);
  registry_.recordSold(sale.index, event.amount_bought, uow);

  event.buyer = buyer;
  event.sale_index = sale.index;
  event.price_in_usd = sale.price_in_usd;
  uow.emit(std::move(event));
}

Sale PurchaseEngine::activeSale(SaleIndex sale_index) const {
  Sale sale = registry_.get(sale_index);
  if (const char* reason = ActiveSaleGuard::inactiveReason(sale, clock_.now_s())) {
    throw StateError("sale " + std::to_string(sale_index) + " is not active: " +
                     reason);
  }
  return sale;
}

void PurchaseEngine::requireCapacity(const Sale& sale, const Amount& amount) {
  const auto remaining = domain::remainingCapacity(sale);
  if (remaining && amount > *remaining) {
    throw CapacityExceededError(
        "sale " + std::to_string(sale.index) + ": " +
        domain::formatAmount(amount) + " exceeds remaining capacity " +
        domain::formatAmount(*remaining));
  }
}

}  // namespace tokensale
