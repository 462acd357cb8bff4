#pragma once

#include "tokensale/domain/amount.hpp"

namespace tokensale {

// -----------------------------------------------------------------------------
// INativeBank — native-currency balances
// -----------------------------------------------------------------------------
// Holds the 18-decimal native balance of every account. buyWithNative moves
// the attached payment buyer -> sale address -> administrator through it, and
// withdrawNativeBalance sweeps the sale address.
//
// transfer() returns false, with no effect, when from holds less than amount.
// Implementations must be safe to call concurrently from any thread.
// -----------------------------------------------------------------------------
class INativeBank {
 public:
  virtual ~INativeBank() = default;

  virtual domain::Amount balanceOf(const domain::Address& account) const = 0;

  virtual bool transfer(const domain::Address& from,
                        const domain::Address& to,
                        const domain::Amount& amount) = 0;
};

}  // namespace tokensale
