#include "tokensale/domain/sale.hpp"
#include "tokensale/errors/sale_error.hpp"

#include <type_traits>

namespace tokensale {
namespace domain {

const char* disbursementMethodToString(DisbursementMethod method) {
  switch (method) {
    case DisbursementMethod::Transfer:     return "Transfer";
    case DisbursementMethod::TransferFrom: return "TransferFrom";
    case DisbursementMethod::Mint:         return "Mint";
  }
  return "Unknown";
}

std::optional<DisbursementMethod> disbursementMethodFromString(
    const std::string& name) {
  if (name == "Transfer") return DisbursementMethod::Transfer;
  if (name == "TransferFrom") return DisbursementMethod::TransferFrom;
  if (name == "Mint") return DisbursementMethod::Mint;
  return std::nullopt;
}

DisbursementMethod methodOf(const Disbursement& disbursement) {
  return std::visit(
      [](const auto& d) -> DisbursementMethod {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, TransferFromCustody>) {
          return DisbursementMethod::Transfer;
        } else if constexpr (std::is_same_v<T, TransferFromHolder>) {
          return DisbursementMethod::TransferFrom;
        } else {
          static_assert(std::is_same_v<T, MintOnDemand>,
                        "unhandled disbursement alternative");
          return DisbursementMethod::Mint;
        }
      },
      disbursement);
}

Address sourceOf(const Sale& sale, const Address& sale_address) {
  return std::visit(
      [&](const auto& d) -> Address {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, TransferFromCustody>) {
          return sale_address;
        } else if constexpr (std::is_same_v<T, TransferFromHolder>) {
          return d.holder;
        } else {
          static_assert(std::is_same_v<T, MintOnDemand>,
                        "unhandled disbursement alternative");
          return sale.asset_address;
        }
      },
      sale.disbursement);
}

Disbursement makeDisbursement(DisbursementMethod method,
                              const Address& source_address) {
  switch (method) {
    case DisbursementMethod::Transfer:
      return TransferFromCustody{};
    case DisbursementMethod::TransferFrom:
      if (isZeroAddress(source_address)) {
        throw ValidationError("TransferFrom disbursement requires a source address");
      }
      return TransferFromHolder{source_address};
    case DisbursementMethod::Mint:
      return MintOnDemand{};
  }
  throw ValidationError("invalid disbursement method");
}

std::optional<Amount> remainingCapacity(const Sale& sale) {
  if (sale.max_tokens_to_sell == 0) {
    return std::nullopt;
  }
  return Amount(sale.max_tokens_to_sell - sale.tokens_sold);
}

}  // namespace domain
}  // namespace tokensale
