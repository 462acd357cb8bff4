#pragma once

#include "tokensale/domain/amount.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace tokensale {
namespace domain {

// -----------------------------------------------------------------------------
// SaleIndex
// -----------------------------------------------------------------------------
// Position of a sale in the append-only registry. Assigned at creation, never
// reused, never reordered.
// -----------------------------------------------------------------------------
using SaleIndex = std::uint64_t;

// Unix seconds. 0 on a sale bound means "no bound on that side".
using UnixTime = std::uint64_t;

// -----------------------------------------------------------------------------
// Disbursement variants
// -----------------------------------------------------------------------------
//
// @brief  How purchased asset units reach the buyer. Exactly one variant per
//         sale, chosen at creation and never changed.
//
// @details
//   TransferFromCustody  asset held by the sale system's own address; moved
//                        with transfer(). Carries no extra data.
//   TransferFromHolder   asset held by an external address that pre-approved
//                        the sale system; moved with transferFrom().
//   MintOnDemand         asset minted straight to the buyer by the asset's own
//                        mint entrypoint. Carries no extra data beyond the
//                        sale's asset address.
//
// Call sites dispatch with std::visit over all three alternatives, so a new
// method fails to compile until every dispatch site handles it.
// -----------------------------------------------------------------------------
struct TransferFromCustody {};

struct TransferFromHolder {
  Address holder;  // Account the units are pulled from
};

struct MintOnDemand {};

using Disbursement =
    std::variant<TransferFromCustody, TransferFromHolder, MintOnDemand>;

// -----------------------------------------------------------------------------
// DisbursementMethod
// -----------------------------------------------------------------------------
// Flat wire-level tag for the variant above, used in creation requests and in
// SaleCreated / SaleUpdated notifications.
// -----------------------------------------------------------------------------
enum class DisbursementMethod {
  Transfer,
  TransferFrom,
  Mint,
};

const char* disbursementMethodToString(DisbursementMethod method);

// Inverse of disbursementMethodToString(); nullopt for unknown names.
std::optional<DisbursementMethod> disbursementMethodFromString(
    const std::string& name);

// -----------------------------------------------------------------------------
// Sale
// -----------------------------------------------------------------------------
//
// @brief  One configured offering: asset, price, cap, window, pause flag and
//         disbursement.
//
// @details
// Invariants maintained by SaleRegistry:
//   - max_tokens_to_sell != 0  =>  tokens_sold <= max_tokens_to_sell
//   - tokens_sold never decreases
//   - disbursement never changes after creation
//
// Value type; copies handed out by the registry are snapshots.
// -----------------------------------------------------------------------------
struct Sale {
  SaleIndex index{0};
  Address asset_address;        // Sale asset, 18-decimal precision
  Disbursement disbursement{TransferFromCustody{}};
  Amount price_in_usd{0};       // 6 decimals; 1'000'000 == $1.00
  Amount max_tokens_to_sell{0}; // 18 decimals; 0 == unbounded
  Amount tokens_sold{0};        // 18 decimals
  UnixTime start_date{0};       // Inclusive; 0 == open start
  UnixTime end_date{0};         // Exclusive; 0 == open end
  bool paused{false};
};

// -----------------------------------------------------------------------------
// SaleParams
// -----------------------------------------------------------------------------
// Everything an administrator supplies to create a sale. source_address is
// only meaningful for TransferFrom; it is ignored for the other methods.
// -----------------------------------------------------------------------------
struct SaleParams {
  Address asset_address;
  Amount price_in_usd{0};
  Amount max_tokens_to_sell{0};
  UnixTime start_date{0};
  UnixTime end_date{0};
  bool paused{false};
  DisbursementMethod method{DisbursementMethod::Transfer};
  Address source_address;
};

DisbursementMethod methodOf(const Disbursement& disbursement);

// -------------------------------------------------------------------------
// sourceOf
// -------------------------------------------------------------------------
// @brief  The address the disbursed units come from.
//
// @param  sale          The sale.
// @param  sale_address  The sale system's own custody address.
//
// @return sale_address for Transfer, the holder for TransferFrom, the asset
//         address for Mint.
// -------------------------------------------------------------------------
Address sourceOf(const Sale& sale, const Address& sale_address);

// -------------------------------------------------------------------------
// makeDisbursement
// -------------------------------------------------------------------------
// @brief  Builds the variant for a creation request.
//
// @throws ValidationError when TransferFrom is requested without a holder.
// -------------------------------------------------------------------------
Disbursement makeDisbursement(DisbursementMethod method,
                              const Address& source_address);

// -------------------------------------------------------------------------
// remainingCapacity
// -------------------------------------------------------------------------
// @return max - sold for a capped sale, nullopt when the sale is unbounded.
// -------------------------------------------------------------------------
std::optional<Amount> remainingCapacity(const Sale& sale);

}  // namespace domain
}  // namespace tokensale
