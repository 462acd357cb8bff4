#pragma once

#include "tokensale/domain/amount.hpp"
#include "tokensale/purchase/payment_settings.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tokensale {

class ContractDirectory;
class FixedPriceFeed;
class InMemoryNativeBank;
class InMemoryToken;

// Malformed or unreadable configuration. what() names the offending key.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message)
      : std::runtime_error(message) {}
};

// One simulated token under "tokens".
struct TokenConfig {
  domain::Address address;
  std::string symbol;
  unsigned decimals{domain::kAssetDecimals};
  bool mintable{false};
  std::vector<domain::Address> minters;
  std::map<domain::Address, domain::Amount> balances;
};

// One simulated feed under "price_feeds".
struct PriceFeedConfig {
  domain::Address address;
  domain::SignedAmount answer{0};
  std::uint64_t updated_at{0};
};

// -----------------------------------------------------------------------------
// EngineConfig
// -----------------------------------------------------------------------------
//
// @brief  Everything the node needs to build a SaleEngine and its simulated
//         ledger.
//
// @details
// JSON layout (all amounts are decimal strings):
//
//   {
//     "admin": "admin",
//     "sale_address": "sale",
//     "stablecoin_a": "usdc", "stablecoin_b": "usdt",
//     "price_oracle": "eth-usd",
//     "ipc": { "command_endpoint": "tcp://127.0.0.1:5556",
//              "publish_endpoint": "tcp://127.0.0.1:5557" },
//     "clock": "live" | <unix seconds>,
//     "tokens": [ { "address": "usdc", "symbol": "USDC", "decimals": 6,
//                   "mintable": false, "minters": [],
//                   "balances": { "alice": "1000000000" } } ],
//     "native_balances": { "alice": "1000000000000000000" },
//     "price_feeds": [ { "address": "eth-usd", "answer": "200000000000",
//                        "updated_at": 0 } ]
//   }
//
// admin and sale_address are required; every other key is optional.
// Setting either ipc endpoint to "" disables the IPC server.
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::Address admin;
  domain::Address sale_address;
  PaymentSettingsSnapshot payment;

  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string publish_endpoint{"tcp://127.0.0.1:5557"};

  // nullopt: wall clock. Otherwise a simulation clock starting here.
  std::optional<std::uint64_t> simulation_start;

  std::vector<TokenConfig> tokens;
  std::map<domain::Address, domain::Amount> native_balances;
  std::vector<PriceFeedConfig> price_feeds;
};

// @throws ConfigError on any malformed key.
EngineConfig parseConfig(const nlohmann::json& j);

// Reads and parses a JSON file. @throws ConfigError.
EngineConfig loadConfig(const std::string& path);

// -----------------------------------------------------------------------------
// SimulatedLedger — the in-memory collaborators built from a config
// -----------------------------------------------------------------------------
struct SimulatedLedger {
  std::map<domain::Address, std::shared_ptr<InMemoryToken>> tokens;
  std::shared_ptr<InMemoryNativeBank> native_bank;
  std::map<domain::Address, std::shared_ptr<FixedPriceFeed>> price_feeds;
};

// -------------------------------------------------------------------------
// buildSimulatedLedger
// -------------------------------------------------------------------------
// @brief  Creates the tokens, native bank and feeds described by config,
//         seeds their balances and registers all of them in directory.
//
// @return Typed handles to what was registered, for tests and tooling.
// -------------------------------------------------------------------------
SimulatedLedger buildSimulatedLedger(const EngineConfig& config,
                                     ContractDirectory& directory);

}  // namespace tokensale
