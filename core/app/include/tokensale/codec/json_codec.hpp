#pragma once

#include "tokensale/domain/amount.hpp"
#include "tokensale/domain/sale.hpp"
#include "tokensale/events/event.hpp"
#include "tokensale/events/sale_events.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace tokensale {
namespace codec {

// -----------------------------------------------------------------------------
// JSON codec
// -----------------------------------------------------------------------------
//
// @brief  Wire form of sales, notifications and request fields for the IPC
//         server and the configuration loader.
//
// @details
// Amounts are decimal strings: 18-decimal quantities do not fit a JSON
// number without loss. Readers also accept a non-negative JSON integer for
// convenience. Every notification carries "type", "sequence_id" and
// "timestamp":
//
//   sale_created, sale_updated (+ "field"), tokens_bought,
//   ownership_transferred, payment_settings_updated,
//   foreign_asset_withdrawn, native_withdrawn
//
// Readers throw ValidationError naming the offending key.
// -----------------------------------------------------------------------------

nlohmann::json toJson(const SaleRecord& record);

nlohmann::json toJson(const Event& event);

// Event type tag ("tokens_bought", ...).
const char* eventTypeName(const Event& event);

// --- Request field readers -----------------------------------------------------

// Required amount: decimal string or non-negative integer.
domain::Amount amountField(const nlohmann::json& j, const char* key);

// Required signed amount: decimal string (optionally '-') or integer.
domain::SignedAmount signedAmountField(const nlohmann::json& j,
                                       const char* key);

// Required string.
std::string stringField(const nlohmann::json& j, const char* key);

// Optional string; fallback when the key is absent or null.
std::string stringField(const nlohmann::json& j, const char* key,
                        const std::string& fallback);

std::uint64_t uintField(const nlohmann::json& j, const char* key);
std::uint64_t uintField(const nlohmann::json& j, const char* key,
                        std::uint64_t fallback);

bool boolField(const nlohmann::json& j, const char* key);
bool boolField(const nlohmann::json& j, const char* key, bool fallback);

// -------------------------------------------------------------------------
// saleParamsFromJson
// -------------------------------------------------------------------------
// Keys: asset_address, price_in_usd, max_tokens_to_sell (default 0),
// start_date / end_date (default 0), paused (default false),
// method ("Transfer" | "TransferFrom" | "Mint", default "Transfer"),
// source_address (default empty).
// -------------------------------------------------------------------------
domain::SaleParams saleParamsFromJson(const nlohmann::json& j);

}  // namespace codec
}  // namespace tokensale
