// =============================================================================
// json_codec_test.cpp
// =============================================================================
// Tests for tokensale::codec: notification encoding and request field readers.
//
// Validates:
//   - Every notification carries "type", "sequence_id", "timestamp"
//   - 256-bit amounts are encoded as decimal strings without loss
//   - Readers accept strings and non-negative integers for amounts, reject
//     everything else with ValidationError
//   - saleParamsFromJson defaults and method parsing
// =============================================================================

#include "tokensale/codec/json_codec.hpp"
#include "tokensale/errors/sale_error.hpp"

#include <gtest/gtest.h>

using nlohmann::json;
using tokensale::domain::Amount;
using tokensale::domain::DisbursementMethod;
namespace codec = tokensale::codec;

// -----------------------------------------------------------------------------
// 1. Encoding.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, TokensBoughtEncodesAmountsAsStrings) {
  tokensale::TokensBoughtEvent e;
  e.buyer = "alice";
  e.sale_index = 3;
  e.amount_bought = Amount("133333333333333333333");
  e.price_in_usd = Amount(1'500'000);
  e.native_sent = Amount(100'000'000'000'000'000ULL);
  e.referral_code = "tg";
  e.sequence_id = 17;
  e.timestamp = 1'700'000'000;

  const json j = codec::toJson(tokensale::Event{e});

  EXPECT_EQ(j["type"], "tokens_bought");
  EXPECT_EQ(j["sequence_id"], 17);
  EXPECT_EQ(j["timestamp"], 1'700'000'000);
  EXPECT_EQ(j["buyer"], "alice");
  EXPECT_EQ(j["sale_index"], 3);
  EXPECT_EQ(j["amount_bought"], "133333333333333333333");
  EXPECT_EQ(j["price_in_usd"], "1500000");
  EXPECT_EQ(j["usd_cost"], "0");
  EXPECT_EQ(j["native_sent"], "100000000000000000");
  EXPECT_EQ(j["pay_token"], "");
  EXPECT_EQ(j["referral_code"], "tg");
}

TEST(JsonCodecTest, SaleUpdatedCarriesRecordAndField) {
  tokensale::SaleUpdatedEvent e;
  e.sale.index = 1;
  e.sale.asset_address = "asset";
  e.sale.max_tokens_to_sell = Amount(
      "115792089237316195423570985008687907853269984665640564039457584007913129639935");
  e.sale.method = DisbursementMethod::TransferFrom;
  e.sale.source_address = "treasury";
  e.field = "max_tokens";

  const json j = codec::toJson(tokensale::Event{e});

  EXPECT_EQ(j["type"], "sale_updated");
  EXPECT_EQ(j["field"], "max_tokens");
  EXPECT_EQ(j["sale"]["method"], "TransferFrom");
  EXPECT_EQ(j["sale"]["source_address"], "treasury");
  EXPECT_EQ(j["sale"]["max_tokens_to_sell"],
            "115792089237316195423570985008687907853269984665640564039457584007913129639935");
}

TEST(JsonCodecTest, EveryEventTypeHasAName) {
  EXPECT_STREQ(codec::eventTypeName(tokensale::SaleCreatedEvent{}),
               "sale_created");
  EXPECT_STREQ(codec::eventTypeName(tokensale::OwnershipTransferredEvent{}),
               "ownership_transferred");
  EXPECT_STREQ(codec::eventTypeName(tokensale::PaymentSettingsUpdatedEvent{}),
               "payment_settings_updated");
  EXPECT_STREQ(codec::eventTypeName(tokensale::ForeignAssetWithdrawnEvent{}),
               "foreign_asset_withdrawn");
  EXPECT_STREQ(codec::eventTypeName(tokensale::NativeWithdrawnEvent{}),
               "native_withdrawn");
}

// -----------------------------------------------------------------------------
// 2. Field readers.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, AmountFieldAcceptsStringsAndNonNegativeIntegers) {
  const json j = {{"s", "1000000000000000000000"},
                  {"n", 42},
                  {"padded", "007"},
                  {"neg", -1},
                  {"frac", "1.5"},
                  {"f", 1.5},
                  {"empty", ""}};

  EXPECT_EQ(codec::amountField(j, "s"), Amount("1000000000000000000000"));
  EXPECT_EQ(codec::amountField(j, "n"), Amount(42));
  EXPECT_EQ(codec::amountField(j, "padded"), Amount(7));
  EXPECT_THROW(codec::amountField(j, "neg"), tokensale::ValidationError);
  EXPECT_THROW(codec::amountField(j, "frac"), tokensale::ValidationError);
  EXPECT_THROW(codec::amountField(j, "f"), tokensale::ValidationError);
  EXPECT_THROW(codec::amountField(j, "empty"), tokensale::ValidationError);
  EXPECT_THROW(codec::amountField(j, "missing"), tokensale::ValidationError);
}

TEST(JsonCodecTest, AmountAboveTwoToThe256IsRejected) {
  const json j = {{"big",
                   "115792089237316195423570985008687907853269984665640564039457584007913129639936"}};
  EXPECT_THROW(codec::amountField(j, "big"), tokensale::ValidationError);
}

TEST(JsonCodecTest, SignedAmountFieldAcceptsNegatives) {
  const json j = {{"a", "-5"}, {"b", -7}};
  EXPECT_EQ(codec::signedAmountField(j, "a"), -5);
  EXPECT_EQ(codec::signedAmountField(j, "b"), -7);
}

TEST(JsonCodecTest, ScalarReadersCheckTypes) {
  const json j = {{"s", "x"}, {"u", 5}, {"b", true}};
  EXPECT_EQ(codec::stringField(j, "s"), "x");
  EXPECT_EQ(codec::stringField(j, "nope", "fallback"), "fallback");
  EXPECT_THROW(codec::stringField(j, "u"), tokensale::ValidationError);
  EXPECT_EQ(codec::uintField(j, "u"), 5u);
  EXPECT_EQ(codec::uintField(j, "nope", 9), 9u);
  EXPECT_THROW(codec::uintField(j, "s"), tokensale::ValidationError);
  EXPECT_TRUE(codec::boolField(j, "b"));
  EXPECT_FALSE(codec::boolField(j, "nope", false));
  EXPECT_THROW(codec::boolField(j, "u"), tokensale::ValidationError);
  EXPECT_THROW(codec::stringField(json::array(), "s"),
               tokensale::ValidationError);
}

// -----------------------------------------------------------------------------
// 3. Sale creation requests.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, SaleParamsDefaults) {
  const auto p = codec::saleParamsFromJson(
      json{{"asset_address", "asset"}, {"price_in_usd", "1000000"}});
  EXPECT_EQ(p.asset_address, "asset");
  EXPECT_EQ(p.price_in_usd, Amount(1'000'000));
  EXPECT_EQ(p.max_tokens_to_sell, 0);
  EXPECT_EQ(p.start_date, 0u);
  EXPECT_EQ(p.end_date, 0u);
  EXPECT_FALSE(p.paused);
  EXPECT_EQ(p.method, DisbursementMethod::Transfer);
  EXPECT_TRUE(p.source_address.empty());
}

TEST(JsonCodecTest, SaleParamsMethods) {
  const auto p = codec::saleParamsFromJson(json{{"asset_address", "asset"},
                                                {"price_in_usd", 1},
                                                {"method", "TransferFrom"},
                                                {"source_address", "treasury"},
                                                {"start_date", 10},
                                                {"end_date", 20},
                                                {"paused", true}});
  EXPECT_EQ(p.method, DisbursementMethod::TransferFrom);
  EXPECT_EQ(p.source_address, "treasury");
  EXPECT_EQ(p.start_date, 10u);
  EXPECT_EQ(p.end_date, 20u);
  EXPECT_TRUE(p.paused);

  EXPECT_THROW(codec::saleParamsFromJson(json{{"asset_address", "asset"},
                                              {"price_in_usd", 1},
                                              {"method", "Airdrop"}}),
               tokensale::ValidationError);
  EXPECT_THROW(codec::saleParamsFromJson(json{{"price_in_usd", 1}}),
               tokensale::ValidationError);
}
