// =============================================================================
// engine_config_test.cpp
// =============================================================================
// Tests for tokensale::parseConfig / loadConfig / buildSimulatedLedger.
//
// Validates:
//   - A full document populates every section; optional sections default
//   - Missing or malformed fields surface as ConfigError naming the section
//   - The simulated ledger registers every token, the native bank and every
//     price feed in the directory with the configured balances
// =============================================================================

#include "tokensale/config/engine_config.hpp"
#include "tokensale/ledger/contract_directory.hpp"
#include "tokensale/ledger/in_memory_native_bank.hpp"
#include "tokensale/ledger/in_memory_token.hpp"
#include "tokensale/oracle/fixed_price_feed.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <string>

using nlohmann::json;
using tokensale::ConfigError;
using tokensale::domain::Amount;

namespace {

json fullConfig() {
  return json::parse(R"({
    "admin": "admin",
    "sale_address": "sale",
    "stablecoin_a": "usdc",
    "stablecoin_b": "usdt",
    "price_oracle": "eth-usd",
    "clock": 1700000000,
    "ipc": { "command_endpoint": "tcp://127.0.0.1:6000",
             "publish_endpoint": "tcp://127.0.0.1:6001" },
    "tokens": [
      { "address": "usdc", "symbol": "USDC", "decimals": 6,
        "balances": { "alice": "1000000000" } },
      { "address": "mint-asset", "mintable": true, "minters": ["sale"] }
    ],
    "native_balances": { "alice": "5000000000000000000" },
    "price_feeds": [ { "address": "eth-usd", "answer": "200000000000" } ]
  })");
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Parsing.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, ParsesFullDocument) {
  const auto config = tokensale::parseConfig(fullConfig());

  EXPECT_EQ(config.admin, "admin");
  EXPECT_EQ(config.sale_address, "sale");
  EXPECT_EQ(config.payment.stablecoin_a, "usdc");
  EXPECT_EQ(config.payment.stablecoin_b, "usdt");
  EXPECT_EQ(config.payment.price_oracle, "eth-usd");
  ASSERT_TRUE(config.simulation_start.has_value());
  EXPECT_EQ(*config.simulation_start, 1'700'000'000u);
  EXPECT_EQ(config.command_endpoint, "tcp://127.0.0.1:6000");
  EXPECT_EQ(config.publish_endpoint, "tcp://127.0.0.1:6001");

  ASSERT_EQ(config.tokens.size(), 2u);
  EXPECT_EQ(config.tokens[0].decimals, 6u);
  EXPECT_EQ(config.tokens[0].balances.at("alice"), Amount(1'000'000'000));
  EXPECT_EQ(config.tokens[1].symbol, "mint-asset");
  EXPECT_TRUE(config.tokens[1].mintable);
  ASSERT_EQ(config.tokens[1].minters.size(), 1u);
  EXPECT_EQ(config.native_balances.at("alice"),
            Amount(5'000'000'000'000'000'000ULL));
  ASSERT_EQ(config.price_feeds.size(), 1u);
  EXPECT_EQ(config.price_feeds[0].answer, 200'000'000'000LL);
}

TEST(EngineConfigTest, OptionalSectionsDefault) {
  const auto config =
      tokensale::parseConfig(json{{"admin", "a"}, {"sale_address", "s"}});
  EXPECT_TRUE(config.payment.stablecoin_a.empty());
  EXPECT_TRUE(config.payment.price_oracle.empty());
  EXPECT_FALSE(config.simulation_start.has_value());
  EXPECT_EQ(config.command_endpoint, "tcp://127.0.0.1:5556");
  EXPECT_EQ(config.publish_endpoint, "tcp://127.0.0.1:5557");
  EXPECT_TRUE(config.tokens.empty());

  const auto live = tokensale::parseConfig(
      json{{"admin", "a"}, {"sale_address", "s"}, {"clock", "live"}});
  EXPECT_FALSE(live.simulation_start.has_value());
}

// -----------------------------------------------------------------------------
// 2. Rejections.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, RejectsMalformedDocuments) {
  EXPECT_THROW(tokensale::parseConfig(json::array()), ConfigError);
  EXPECT_THROW(tokensale::parseConfig(json{{"sale_address", "s"}}),
               ConfigError);
  EXPECT_THROW(tokensale::parseConfig(json{{"admin", ""}, {"sale_address", "s"}}),
               ConfigError);
  EXPECT_THROW(tokensale::parseConfig(
                   json{{"admin", "a"}, {"sale_address", "s"}, {"clock", "soon"}}),
               ConfigError);

  auto bad_balance = fullConfig();
  bad_balance["tokens"][0]["balances"]["alice"] = "-3";
  try {
    tokensale::parseConfig(bad_balance);
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_NE(std::string(e.what()).find("tokens[0].balances.alice"),
              std::string::npos);
  }

  auto bad_feed = fullConfig();
  bad_feed["price_feeds"][0].erase("answer");
  EXPECT_THROW(tokensale::parseConfig(bad_feed), ConfigError);
}

TEST(EngineConfigTest, LoadConfigReportsIoAndSyntaxErrors) {
  EXPECT_THROW(tokensale::loadConfig("/nonexistent/tokensale.json"),
               ConfigError);

  const std::string path = ::testing::TempDir() + "tokensale_bad.json";
  {
    std::ofstream out(path);
    out << "{ not json";
  }
  EXPECT_THROW(tokensale::loadConfig(path), ConfigError);

  const std::string good = ::testing::TempDir() + "tokensale_good.json";
  {
    std::ofstream out(good);
    out << fullConfig().dump();
  }
  EXPECT_EQ(tokensale::loadConfig(good).sale_address, "sale");
}

// -----------------------------------------------------------------------------
// 3. Simulated ledger.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, BuildsSimulatedLedgerIntoDirectory) {
  tokensale::ContractDirectory directory;
  const auto ledger =
      tokensale::buildSimulatedLedger(tokensale::parseConfig(fullConfig()),
                                      directory);

  auto usdc = directory.token("usdc");
  ASSERT_NE(usdc, nullptr);
  EXPECT_EQ(usdc->decimals(), 6u);
  EXPECT_EQ(usdc->balanceOf("alice"), Amount(1'000'000'000));

  auto minter = directory.mintable("mint-asset");
  ASSERT_NE(minter, nullptr);
  EXPECT_TRUE(minter->mint("sale", "bob", 1));
  EXPECT_TRUE(ledger.tokens.at("mint-asset")->isMinter("sale"));

  auto bank = directory.nativeBank();
  ASSERT_NE(bank, nullptr);
  EXPECT_EQ(bank->balanceOf("alice"), Amount(5'000'000'000'000'000'000ULL));

  auto feed = directory.priceFeed("eth-usd");
  ASSERT_NE(feed, nullptr);
  EXPECT_EQ(feed->latestAnswer().answer, 200'000'000'000LL);
  EXPECT_EQ(directory.tokenAddresses().size(), 2u);
}
