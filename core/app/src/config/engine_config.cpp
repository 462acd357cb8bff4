#include "tokensale/config/engine_config.hpp"

#include "tokensale/codec/json_codec.hpp"
#include "tokensale/errors/sale_error.hpp"
#include "tokensale/ledger/contract_directory.hpp"
#include "tokensale/ledger/in_memory_native_bank.hpp"
#include "tokensale/ledger/in_memory_token.hpp"
#include "tokensale/oracle/fixed_price_feed.hpp"

#include <fstream>
#include <iostream>
#include <utility>

namespace tokensale {

using nlohmann::json;

namespace {

// Runs a reader and rewraps its ValidationError as ConfigError with the path
// of the section being read.
template <typename Fn>
auto section(const std::string& where, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const ValidationError& e) {
    throw ConfigError(where + ": " + e.what());
  }
}

std::map<domain::Address, domain::Amount> balanceMap(const json& j,
                                                     const std::string& where) {
  std::map<domain::Address, domain::Amount> out;
  if (j.is_null()) {
    return out;
  }
  if (!j.is_object()) {
    throw ConfigError(where + ": must be an object of address -> amount");
  }
  for (auto it = j.begin(); it != j.end(); ++it) {
    json wrapper = {{"amount", it.value()}};
    out[it.key()] = section(where + "." + it.key(), [&] {
      return codec::amountField(wrapper, "amount");
    });
  }
  return out;
}

const json& member(const json& j, const char* key) {
  static const json kNull;
  auto it = j.find(key);
  return it == j.end() ? kNull : *it;
}

}  // namespace

EngineConfig parseConfig(const json& j) {
  if (!j.is_object()) {
    throw ConfigError("configuration root must be a JSON object");
  }

  EngineConfig config;
  section("config", [&] {
    config.admin = codec::stringField(j, "admin");
    config.sale_address = codec::stringField(j, "sale_address");
    config.payment.stablecoin_a = codec::stringField(j, "stablecoin_a", "");
    config.payment.stablecoin_b = codec::stringField(j, "stablecoin_b", "");
    config.payment.price_oracle = codec::stringField(j, "price_oracle", "");
    return 0;
  });
  if (config.admin.empty()) {
    throw ConfigError("config: 'admin' must not be empty");
  }
  if (config.sale_address.empty()) {
    throw ConfigError("config: 'sale_address' must not be empty");
  }

  const json& ipc = member(j, "ipc");
  if (!ipc.is_null()) {
    section("ipc", [&] {
      config.command_endpoint = codec::stringField(
          ipc, "command_endpoint", config.command_endpoint);
      config.publish_endpoint = codec::stringField(
          ipc, "publish_endpoint", config.publish_endpoint);
      return 0;
    });
  }

  const json& clock = member(j, "clock");
  if (clock.is_string()) {
    if (clock.get<std::string>() != "live") {
      throw ConfigError("clock: expected \"live\" or a unix time");
    }
  } else if (!clock.is_null()) {
    config.simulation_start =
        section("clock", [&] { return codec::uintField(j, "clock"); });
  }

  const json& tokens = member(j, "tokens");
  if (!tokens.is_null() && !tokens.is_array()) {
    throw ConfigError("tokens: must be an array");
  }
  for (std::size_t i = 0; tokens.is_array() && i < tokens.size(); ++i) {
    const std::string where = "tokens[" + std::to_string(i) + "]";
    const json& t = tokens[i];
    TokenConfig token;
    section(where, [&] {
      token.address = codec::stringField(t, "address");
      token.symbol = codec::stringField(t, "symbol", token.address);
      token.decimals = static_cast<unsigned>(
          codec::uintField(t, "decimals", domain::kAssetDecimals));
      token.mintable = codec::boolField(t, "mintable", false);
      return 0;
    });
    const json& minters = member(t, "minters");
    if (!minters.is_null() && !minters.is_array()) {
      throw ConfigError(where + ".minters: must be an array");
    }
    for (std::size_t m = 0; minters.is_array() && m < minters.size(); ++m) {
      if (!minters[m].is_string()) {
        throw ConfigError(where + ".minters: entries must be strings");
      }
      token.minters.push_back(minters[m].get<std::string>());
    }
    token.balances = balanceMap(member(t, "balances"), where + ".balances");
    config.tokens.push_back(std::move(token));
  }

  config.native_balances =
      balanceMap(member(j, "native_balances"), "native_balances");

  const json& feeds = member(j, "price_feeds");
  if (!feeds.is_null() && !feeds.is_array()) {
    throw ConfigError("price_feeds: must be an array");
  }
  for (std::size_t i = 0; feeds.is_array() && i < feeds.size(); ++i) {
    const std::string where = "price_feeds[" + std::to_string(i) + "]";
    const json& f = feeds[i];
    PriceFeedConfig feed;
    section(where, [&] {
      feed.address = codec::stringField(f, "address");
      feed.answer = codec::signedAmountField(f, "answer");
      feed.updated_at = codec::uintField(f, "updated_at", 0);
      return 0;
    });
    config.price_feeds.push_back(std::move(feed));
  }

  return config;
}

EngineConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open configuration file '" + path + "'");
  }
  json j;
  try {
    in >> j;
  } catch (const json::parse_error& e) {
    throw ConfigError("'" + path + "' is not valid JSON: " + e.what());
  }
  return parseConfig(j);
}

SimulatedLedger buildSimulatedLedger(const EngineConfig& config,
                                     ContractDirectory& directory) {
  SimulatedLedger ledger;

  for (const auto& t : config.tokens) {
    auto token =
        std::make_shared<InMemoryToken>(t.symbol, t.decimals, t.mintable);
    for (const auto& minter : t.minters) {
      token->addMinter(minter);
    }
    for (const auto& [account, amount] : t.balances) {
      token->setBalance(account, amount);
    }
    directory.registerToken(t.address, token);
    ledger.tokens[t.address] = std::move(token);
  }

  ledger.native_bank = std::make_shared<InMemoryNativeBank>();
  for (const auto& [account, amount] : config.native_balances) {
    ledger.native_bank->setBalance(account, amount);
  }
  directory.setNativeBank(ledger.native_bank);

  for (const auto& f : config.price_feeds) {
    auto feed = std::make_shared<FixedPriceFeed>(f.answer, f.updated_at);
    directory.registerPriceFeed(f.address, feed);
    ledger.price_feeds[f.address] = std::move(feed);
  }

  std::cout << "[Config] simulated ledger: " << ledger.tokens.size()
            << " token(s), " << ledger.price_feeds.size()
            << " price feed(s), " << config.native_balances.size()
            << " native account(s)\n";
  return ledger;
}

}  // namespace tokensale
