#pragma once

#include "tokensale/domain/amount.hpp"
#include "tokensale/domain/sale.hpp"

namespace tokensale {

class ContractDirectory;
class UnitOfWork;

// -----------------------------------------------------------------------------
// DisbursementStrategy — moves purchased units to the buyer
// -----------------------------------------------------------------------------
//
// @brief  Dispatches on the sale's Disbursement variant:
//
//   TransferFromCustody  asset.transfer(sale_address -> buyer)
//   TransferFromHolder   asset.transferFrom(spender = sale_address,
//                                           from = holder, to = buyer)
//   MintOnDemand         asset.mint(caller = sale_address, buyer)
//
// @details
// The asset is resolved through ContractDirectory by the sale's
// asset_address and enlisted in the caller's unit of work before it is
// called. Every path that does not move the units (unknown asset, a false
// return, a non-mintable asset) throws TransferFailureError. Anything the
// asset itself throws propagates unchanged.
//
// Dispatch uses std::visit with a static_assert on the alternatives, so a
// new disbursement method does not compile until handled here.
// -----------------------------------------------------------------------------
class DisbursementStrategy {
 public:
  DisbursementStrategy(const ContractDirectory& directory,
                       domain::Address sale_address);

  // @throws TransferFailureError (see above).
  void disburse(const domain::Sale& sale, const domain::Address& buyer,
                const domain::Amount& amount, UnitOfWork& uow) const;

 private:
  const ContractDirectory& directory_;
  const domain::Address sale_address_;
};

}  // namespace tokensale
