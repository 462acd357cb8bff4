#include "tokensale/codec/json_codec.hpp"

#include "tokensale/errors/sale_error.hpp"

#include <type_traits>
#include <variant>

namespace tokensale {
namespace codec {

using nlohmann::json;

// -----------------------------------------------------------------------------
// Encoders
// -----------------------------------------------------------------------------
json toJson(const SaleRecord& record) {
  json j;
  j["index"] = record.index;
  j["asset_address"] = record.asset_address;
  j["price_in_usd"] = domain::formatAmount(record.price_in_usd);
  j["max_tokens_to_sell"] = domain::formatAmount(record.max_tokens_to_sell);
  j["tokens_sold"] = domain::formatAmount(record.tokens_sold);
  j["start_date"] = record.start_date;
  j["end_date"] = record.end_date;
  j["paused"] = record.paused;
  j["method"] = domain::disbursementMethodToString(record.method);
  j["source_address"] = record.source_address;
  return j;
}

const char* eventTypeName(const Event& event) {
  return std::visit(
      [](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, SaleCreatedEvent>) {
          return "sale_created";
        } else if constexpr (std::is_same_v<T, SaleUpdatedEvent>) {
          return "sale_updated";
        } else if constexpr (std::is_same_v<T, TokensBoughtEvent>) {
          return "tokens_bought";
        } else if constexpr (std::is_same_v<T, OwnershipTransferredEvent>) {
          return "ownership_transferred";
        } else if constexpr (std::is_same_v<T, PaymentSettingsUpdatedEvent>) {
          return "payment_settings_updated";
        } else if constexpr (std::is_same_v<T, ForeignAssetWithdrawnEvent>) {
          return "foreign_asset_withdrawn";
        } else {
          static_assert(std::is_same_v<T, NativeWithdrawnEvent>,
                        "unhandled event type");
          return "native_withdrawn";
        }
      },
      event);
}

json toJson(const Event& event) {
  json j = std::visit(
      [](const auto& e) -> json {
        using T = std::decay_t<decltype(e)>;
        json body;
        if constexpr (std::is_same_v<T, SaleCreatedEvent>) {
          body["sale"] = toJson(e.sale);
        } else if constexpr (std::is_same_v<T, SaleUpdatedEvent>) {
          body["sale"] = toJson(e.sale);
          body["field"] = e.field;
        } else if constexpr (std::is_same_v<T, TokensBoughtEvent>) {
          body["buyer"] = e.buyer;
          body["sale_index"] = e.sale_index;
          body["amount_bought"] = domain::formatAmount(e.amount_bought);
          body["price_in_usd"] = domain::formatAmount(e.price_in_usd);
          body["usd_cost"] = domain::formatAmount(e.usd_cost);
          body["native_sent"] = domain::formatAmount(e.native_sent);
          body["pay_token"] = e.pay_token;
          body["referral_code"] = e.referral_code;
        } else if constexpr (std::is_same_v<T, OwnershipTransferredEvent>) {
          body["previous_owner"] = e.previous_owner;
          body["new_owner"] = e.new_owner;
        } else if constexpr (std::is_same_v<T, PaymentSettingsUpdatedEvent>) {
          body["setting"] = e.setting;
          body["address"] = e.address;
        } else if constexpr (std::is_same_v<T, ForeignAssetWithdrawnEvent>) {
          body["asset"] = e.asset;
          body["to"] = e.to;
          body["amount"] = domain::formatAmount(e.amount);
        } else {
          static_assert(std::is_same_v<T, NativeWithdrawnEvent>,
                        "unhandled event type");
          body["to"] = e.to;
          body["amount"] = domain::formatAmount(e.amount);
        }
        body["sequence_id"] = e.sequence_id;
        body["timestamp"] = e.timestamp;
        return body;
      },
      event);
  j["type"] = eventTypeName(event);
  return j;
}

// -----------------------------------------------------------------------------
// Field readers
// -----------------------------------------------------------------------------
namespace {

const json& required(const json& j, const char* key) {
  if (!j.is_object()) {
    throw ValidationError("expected a JSON object");
  }
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    throw ValidationError(std::string("missing field '") + key + "'");
  }
  return *it;
}

bool present(const json& j, const char* key) {
  if (!j.is_object()) {
    return false;
  }
  auto it = j.find(key);
  return it != j.end() && !it->is_null();
}

[[noreturn]] void badType(const char* key, const char* expected) {
  throw ValidationError(std::string("field '") + key + "' must be " + expected);
}

}  // namespace

domain::Amount amountField(const json& j, const char* key) {
  const json& v = required(j, key);
  if (v.is_string()) {
    return domain::parseAmount(v.get<std::string>());
  }
  if (v.is_number_unsigned()) {
    return domain::Amount(v.get<std::uint64_t>());
  }
  if (v.is_number_integer() && v.get<std::int64_t>() >= 0) {
    return domain::Amount(static_cast<std::uint64_t>(v.get<std::int64_t>()));
  }
  badType(key, "a non-negative decimal string");
}

domain::SignedAmount signedAmountField(const json& j, const char* key) {
  const json& v = required(j, key);
  if (v.is_string()) {
    return domain::parseSignedAmount(v.get<std::string>());
  }
  if (v.is_number_integer()) {
    return domain::SignedAmount(v.get<std::int64_t>());
  }
  badType(key, "a decimal string");
}

std::string stringField(const json& j, const char* key) {
  const json& v = required(j, key);
  if (!v.is_string()) {
    badType(key, "a string");
  }
  return v.get<std::string>();
}

std::string stringField(const json& j, const char* key,
                        const std::string& fallback) {
  return present(j, key) ? stringField(j, key) : fallback;
}

std::uint64_t uintField(const json& j, const char* key) {
  const json& v = required(j, key);
  if (v.is_number_unsigned()) {
    return v.get<std::uint64_t>();
  }
  if (v.is_number_integer() && v.get<std::int64_t>() >= 0) {
    return static_cast<std::uint64_t>(v.get<std::int64_t>());
  }
  badType(key, "a non-negative integer");
}

std::uint64_t uintField(const json& j, const char* key,
                        std::uint64_t fallback) {
  return present(j, key) ? uintField(j, key) : fallback;
}

bool boolField(const json& j, const char* key) {
  const json& v = required(j, key);
  if (!v.is_boolean()) {
    badType(key, "a boolean");
  }
  return v.get<bool>();
}

bool boolField(const json& j, const char* key, bool fallback) {
  return present(j, key) ? boolField(j, key) : fallback;
}

domain::SaleParams saleParamsFromJson(const json& j) {
  domain::SaleParams params;
  params.asset_address = stringField(j, "asset_address");
  params.price_in_usd = amountField(j, "price_in_usd");
  params.max_tokens_to_sell = present(j, "max_tokens_to_sell")
                                  ? amountField(j, "max_tokens_to_sell")
                                  : domain::Amount(0);
  params.start_date = uintField(j, "start_date", 0);
  params.end_date = uintField(j, "end_date", 0);
  params.paused = boolField(j, "paused", false);

  const std::string method = stringField(j, "method", "Transfer");
  auto parsed = domain::disbursementMethodFromString(method);
  if (!parsed) {
    throw ValidationError("unknown disbursement method '" + method + "'");
  }
  params.method = *parsed;
  params.source_address = stringField(j, "source_address", "");
  return params;
}

}  // namespace codec
}  // namespace tokensale
