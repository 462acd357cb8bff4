#include "tokensale/sale/disbursement_strategy.hpp"

#include "tokensale/errors/sale_error.hpp"
#include "tokensale/ledger/contract_directory.hpp"
#include "tokensale/ledger/unit_of_work.hpp"

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace tokensale {

namespace {

template <typename>
inline constexpr bool kAlwaysFalse = false;

std::string describe(const domain::Sale& sale, const domain::Amount& amount,
                     const domain::Address& buyer) {
  return "sale " + std::to_string(sale.index) + ": " +
         domain::disbursementMethodToString(
             domain::methodOf(sale.disbursement)) +
         " of " + domain::formatAmount(amount) + " '" + sale.asset_address +
         "' to '" + buyer + "'";
}

}  // namespace

DisbursementStrategy::DisbursementStrategy(const ContractDirectory& directory,
                                           domain::Address sale_address)
    : directory_(directory), sale_address_(std::move(sale_address)) {}

void DisbursementStrategy::disburse(const domain::Sale& sale,
                                    const domain::Address& buyer,
                                    const domain::Amount& amount,
                                    UnitOfWork& uow) const {
  directory_.enlist(uow, sale.asset_address);

  const bool moved = std::visit(
      [&](const auto& method) -> bool {
        using T = std::decay_t<decltype(method)>;
        if constexpr (std::is_same_v<T, domain::MintOnDemand>) {
          auto minter = directory_.mintable(sale.asset_address);
          return minter && minter->mint(sale_address_, buyer, amount);
        } else {
          auto token = directory_.token(sale.asset_address);
          if (!token) {
            return false;
          }
          if constexpr (std::is_same_v<T, domain::TransferFromCustody>) {
            return token->transfer(sale_address_, buyer, amount);
          } else if constexpr (std::is_same_v<T, domain::TransferFromHolder>) {
            return token->transferFrom(sale_address_, method.holder, buyer,
                                       amount);
          } else {
            static_assert(kAlwaysFalse<T>, "unhandled disbursement method");
          }
        }
      },
      sale.disbursement);

  if (!moved) {
    throw TransferFailureError(describe(sale, amount, buyer) + " failed");
  }
}

}  // namespace tokensale
