#pragma once

#include "tokensale/domain/amount.hpp"
#include "tokensale/domain/sale.hpp"

#include <cstdint>
#include <string>

namespace tokensale {

// -----------------------------------------------------------------------------
// Notification payloads
// -----------------------------------------------------------------------------
//
// @brief  Plain value structs carried by the Event variant. Each one holds the
//         full record relevant to the change so subscribers never have to read
//         back from the registry.
//
// @details
// timestamp (unix seconds from the engine clock) and sequence_id (monotonic
// across all notifications) are stamped by the UnitOfWork when the event is
// queued; producers leave them zero.
//
// Notifications are published only after the unit of work that produced them
// has committed, so a subscriber never observes a change that was rolled back.
// -----------------------------------------------------------------------------

// -----------------------------------------------------------------------------
// SaleRecord — the flattened sale carried by SaleCreated / SaleUpdated
// -----------------------------------------------------------------------------
struct SaleRecord {
  domain::SaleIndex index{0};
  domain::Address asset_address;
  domain::Amount price_in_usd{0};
  domain::Amount max_tokens_to_sell{0};
  domain::Amount tokens_sold{0};
  domain::UnixTime start_date{0};
  domain::UnixTime end_date{0};
  bool paused{false};
  domain::DisbursementMethod method{domain::DisbursementMethod::Transfer};
  domain::Address source_address;
};

// Flattens a Sale; sale_address resolves the Transfer variant's source.
SaleRecord toRecord(const domain::Sale& sale,
                    const domain::Address& sale_address);

// Raised once per successful create-sale.
struct SaleCreatedEvent {
  SaleRecord sale;
  std::uint64_t timestamp{0};
  std::uint64_t sequence_id{0};
};

// Raised by every admin setter with the post-mutation record. field names the
// setter that fired ("price", "max_tokens", "start_date", "end_date",
// "asset_address", "paused").
struct SaleUpdatedEvent {
  SaleRecord sale;
  std::string field;
  std::uint64_t timestamp{0};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// TokensBoughtEvent
// -----------------------------------------------------------------------------
// One per successful purchase. Exactly one of usd_cost / native_sent is
// non-zero: usd_cost for stablecoin purchases (6 decimals), native_sent for
// native purchases (18 decimals). pay_token is empty for native purchases.
// -----------------------------------------------------------------------------
struct TokensBoughtEvent {
  domain::Address buyer;
  domain::SaleIndex sale_index{0};
  domain::Amount amount_bought{0};
  domain::Amount price_in_usd{0};
  domain::Amount usd_cost{0};
  domain::Amount native_sent{0};
  domain::Address pay_token;
  std::string referral_code;
  std::uint64_t timestamp{0};
  std::uint64_t sequence_id{0};
};

struct OwnershipTransferredEvent {
  domain::Address previous_owner;
  domain::Address new_owner;
  std::uint64_t timestamp{0};
  std::uint64_t sequence_id{0};
};

// Stablecoin slot or oracle reference changed. setting is one of
// "stablecoin_a", "stablecoin_b", "price_oracle".
struct PaymentSettingsUpdatedEvent {
  std::string setting;
  domain::Address address;
  std::uint64_t timestamp{0};
  std::uint64_t sequence_id{0};
};

struct ForeignAssetWithdrawnEvent {
  domain::Address asset;
  domain::Address to;
  domain::Amount amount{0};
  std::uint64_t timestamp{0};
  std::uint64_t sequence_id{0};
};

struct NativeWithdrawnEvent {
  domain::Address to;
  domain::Amount amount{0};
  std::uint64_t timestamp{0};
  std::uint64_t sequence_id{0};
};

}  // namespace tokensale
