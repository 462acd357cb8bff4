#pragma once

#include "tokensale/domain/amount.hpp"

namespace tokensale {

// -----------------------------------------------------------------------------
// IAssetToken — fungible-asset collaborator
// -----------------------------------------------------------------------------
//
// @brief  The transfer surface of a payment stablecoin or a sale asset.
//
// @details
// Every mutating call names its caller explicitly: transfer() moves the
// caller's own units, transferFrom() consumes an allowance that from granted
// to spender, approve() sets owner's allowance for spender. A false return
// means the movement did not happen (insufficient balance or allowance,
// unknown account); implementations must not partially apply a failed call.
//
// Thread-safety contract:
//   Implementations must be safe to call concurrently from any thread.
//
// Ownership:
//   Looked up through ContractDirectory by address; the directory (or the
//   test fixture) owns the instance.
// -----------------------------------------------------------------------------
class IAssetToken {
 public:
  virtual ~IAssetToken() = default;

  virtual domain::Amount balanceOf(const domain::Address& account) const = 0;

  virtual domain::Amount allowance(const domain::Address& owner,
                                   const domain::Address& spender) const = 0;

  virtual unsigned decimals() const = 0;

  virtual bool transfer(const domain::Address& caller,
                        const domain::Address& to,
                        const domain::Amount& amount) = 0;

  virtual bool transferFrom(const domain::Address& spender,
                            const domain::Address& from,
                            const domain::Address& to,
                            const domain::Amount& amount) = 0;

  virtual bool approve(const domain::Address& owner,
                       const domain::Address& spender,
                       const domain::Amount& amount) = 0;
};

// -----------------------------------------------------------------------------
// IMintableToken — the asset-defined mint entrypoint
// -----------------------------------------------------------------------------
// mint() creates amount units directly to recipient. It returns false when
// caller lacks mint rights; the token decides who may mint.
// -----------------------------------------------------------------------------
class IMintableToken {
 public:
  virtual ~IMintableToken() = default;

  virtual bool mint(const domain::Address& caller,
                    const domain::Address& recipient,
                    const domain::Amount& amount) = 0;
};

}  // namespace tokensale
