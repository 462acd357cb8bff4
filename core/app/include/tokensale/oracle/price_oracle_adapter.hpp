#pragma once

#include "tokensale/domain/amount.hpp"

namespace tokensale {

class ContractDirectory;
class PaymentSettings;

// -----------------------------------------------------------------------------
// PriceOracleAdapter — validated native/USD rate
// -----------------------------------------------------------------------------
//
// @brief  Resolves the configured price feed and returns its latest answer
//         as an unsigned 8-decimal rate.
//
// @details
// The feed address is read from PaymentSettings on every call. Decimal
// alignment is the caller's job: the rate keeps the feed's 8 decimals.
//
// Failure modes, all reported as OracleError:
//   - no oracle configured, or nothing registered at its address
//   - the feed itself throws
//   - the answer is zero or negative
// -----------------------------------------------------------------------------
class PriceOracleAdapter {
 public:
  PriceOracleAdapter(const ContractDirectory& directory,
                     const PaymentSettings& settings);

  // @throws OracleError (see above).
  domain::Amount latestUsdPerNative() const;

 private:
  const ContractDirectory& directory_;
  const PaymentSettings& settings_;
};

}  // namespace tokensale
