#pragma once

#include "tokensale/domain/amount.hpp"

namespace tokensale {
namespace pricing {

// -----------------------------------------------------------------------------
// Purchase conversions
// -----------------------------------------------------------------------------
//
// Every division truncates toward zero, and the chained native conversion
// truncates twice. Results must match bit-for-bit what other implementations
// of the protocol compute, so the order of operations below is fixed.
//
// Overflow of the 256-bit intermediates throws ValidationError.
// -----------------------------------------------------------------------------

// floor(amount * price_in_usd / 10^18): 18-decimal asset units at a
// 6-decimal price -> 6-decimal USD cost.
domain::Amount usdCost(const domain::Amount& amount,
                       const domain::Amount& price_in_usd);

// floor(native_sent * rate / 10^8): 18-decimal native units at an 8-decimal
// oracle rate -> USD value carrying 18 decimals.
domain::Amount usdValueOfNative(const domain::Amount& native_sent,
                                const domain::Amount& rate);

// -------------------------------------------------------------------------
// assetAmountForUsd
// -------------------------------------------------------------------------
// floor(usd_value * 10^6 / price_in_usd): USD value from usdValueOfNative()
// at a 6-decimal price -> 18-decimal asset units.
//
// @throws ValidationError if price_in_usd is zero.
// -------------------------------------------------------------------------
domain::Amount assetAmountForUsd(const domain::Amount& usd_value,
                                 const domain::Amount& price_in_usd);

}  // namespace pricing
}  // namespace tokensale
