#pragma once

#include "tokensale/access/access_control.hpp"
#include "tokensale/concurrent/reentrancy_guard.hpp"
#include "tokensale/concurrent/sequence_generator.hpp"
#include "tokensale/config/engine_config.hpp"
#include "tokensale/domain/amount.hpp"
#include "tokensale/domain/sale.hpp"
#include "tokensale/eventbus/event_bus.hpp"
#include "tokensale/ledger/contract_directory.hpp"
#include "tokensale/network/ipc_server.hpp"
#include "tokensale/oracle/price_oracle_adapter.hpp"
#include "tokensale/purchase/payment_settings.hpp"
#include "tokensale/purchase/purchase_engine.hpp"
#include "tokensale/sale/disbursement_strategy.hpp"
#include "tokensale/sale/sale_registry.hpp"
#include "tokensale/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tokensale {

class UnitOfWork;

// -----------------------------------------------------------------------------
// SaleEngine
// -----------------------------------------------------------------------------
//
// @brief  Root object of a token-sale node. Owns every component and exposes
//         the full external surface: administrator operations, purchases,
//         reads, and the IPC command handler.
//
// @details
// Every mutating operation, admin or purchase, runs in the same frame:
//
//   ReentrancyGuard::Scope  ->  UnitOfWork  ->  component calls  ->  commit
//   -> release guard  ->  EventBus::publishAll(committed notifications)
//
// so all mutations are serialized system-wide, any failure rolls back every
// participant, and subscribers only ever see committed changes.
//
// Callers pass their address explicitly (there is no ambient "sender").
//
// Thread model:
//   All public operations are callable from any thread, including the IPC
//   worker. start()/stop() are called from the owning thread and are
//   idempotent. The IpcServer is created in start() only when both
//   endpoints are non-empty, so tests drive the engine directly.
//
// Ownership:
//   SaleEngine
//    ├── clock_          (const ITimeProvider& — non-owning, must outlive)
//    ├── sequence_       (SequenceGenerator)
//    ├── guard_          (ReentrancyGuard)
//    ├── bus_            (EventBus)
//    ├── directory_      (ContractDirectory — tokens, bank, feeds)
//    ├── access_         (AccessControl)
//    ├── settings_       (PaymentSettings)
//    ├── registry_       (SaleRegistry)
//    ├── oracle_         (PriceOracleAdapter)
//    ├── disbursement_   (DisbursementStrategy)
//    ├── purchases_      (PurchaseEngine)
//    └── ipc_server_     (unique_ptr<IpcServer>, created by start())
//
// Members are declared in dependency order; the IPC server is stopped before
// anything it calls into is destroyed.
// -----------------------------------------------------------------------------
class SaleEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  config  admin, sale_address, initial payment settings and IPC
  //                 endpoints. The simulated-ledger sections are not read
  //                 here; see buildSimulatedLedger().
  // @param  clock   Time source for sale windows and notification stamps.
  //
  // @throws ValidationError if config.admin is empty.
  // -------------------------------------------------------------------------
  SaleEngine(const EngineConfig& config, const ITimeProvider& clock);

  ~SaleEngine();

  SaleEngine(const SaleEngine&) = delete;
  SaleEngine& operator=(const SaleEngine&) = delete;
  SaleEngine(SaleEngine&&) = delete;
  SaleEngine& operator=(SaleEngine&&) = delete;

  void start();
  void stop();
  bool isRunning() const { return running_; }

  // --- Administrator operations ----------------------------------------------
  // Each throws AuthorizationError for a non-administrator caller with no
  // side effects.

  domain::SaleIndex createSale(const domain::Address& caller,
                               const domain::SaleParams& params);

  void setPrice(const domain::Address& caller, domain::SaleIndex index,
                const domain::Amount& price_in_usd);
  void setMaxTokens(const domain::Address& caller, domain::SaleIndex index,
                    const domain::Amount& max_tokens);
  void setStartDate(const domain::Address& caller, domain::SaleIndex index,
                    domain::UnixTime start_date);
  void setEndDate(const domain::Address& caller, domain::SaleIndex index,
                  domain::UnixTime end_date);
  void setAssetAddress(const domain::Address& caller, domain::SaleIndex index,
                       const domain::Address& asset_address);
  void setPaused(const domain::Address& caller, domain::SaleIndex index,
                 bool paused);

  void setStablecoin(const domain::Address& caller, StableSlot slot,
                     const domain::Address& token);
  void setPriceOracle(const domain::Address& caller,
                      const domain::Address& feed);

  // @throws ValidationError if new_owner is empty.
  void transferOwnership(const domain::Address& caller,
                         const domain::Address& new_owner);

  // -------------------------------------------------------------------------
  // withdrawForeignAsset
  // -------------------------------------------------------------------------
  // @brief  Sweeps amount of any token held at the sale address to the
  //         administrator.
  //
  // @throws ValidationError      amount is zero.
  //         TransferFailureError unknown token or insufficient balance.
  // -------------------------------------------------------------------------
  void withdrawForeignAsset(const domain::Address& caller,
                            const domain::Address& asset,
                            const domain::Amount& amount);

  // -------------------------------------------------------------------------
  // withdrawNativeBalance
  // -------------------------------------------------------------------------
  // @brief  Sweeps the sale address's whole native balance to the
  //         administrator.
  //
  // @return The amount moved.
  //
  // @throws ValidationError      the balance is zero.
  //         TransferFailureError no native bank configured.
  // -------------------------------------------------------------------------
  domain::Amount withdrawNativeBalance(const domain::Address& caller);

  // --- Purchases ---------------------------------------------------------------

  TokensBoughtEvent buyWithStablecoinA(const domain::Address& buyer,
                                       domain::SaleIndex index,
                                       const domain::Amount& amount,
                                       const std::string& referral_code);

  TokensBoughtEvent buyWithStablecoinB(const domain::Address& buyer,
                                       domain::SaleIndex index,
                                       const domain::Amount& amount,
                                       const std::string& referral_code);

  // Stablecoin purchase naming the pay token directly.
  TokensBoughtEvent buyWithStable(const domain::Address& buyer,
                                  domain::SaleIndex index,
                                  const domain::Address& pay_token,
                                  const domain::Amount& amount,
                                  const std::string& referral_code);

  // native_sent is the payment attached to the call.
  TokensBoughtEvent buyWithNative(const domain::Address& buyer,
                                  domain::SaleIndex index,
                                  const domain::Amount& native_sent,
                                  const std::string& referral_code);

  // --- Reads -------------------------------------------------------------------

  domain::Sale sale(domain::SaleIndex index) const;
  std::size_t saleCount() const;
  std::vector<domain::Sale> sales() const;
  domain::Address owner() const;
  PaymentSettingsSnapshot paymentSettings() const;
  const domain::Address& saleAddress() const;

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  //
  // @brief  Handles one IPC request (a JSON object with "op") and returns the
  //         JSON reply.
  //
  // @details
  // Success:  {"status":"ok", ...op-specific fields...}
  // Failure:  {"status":"error","error":"<ErrorKind>","response":"<message>"}
  //
  // Never throws; every failure becomes an error reply.
  //
  // Thread-safety: Safe from any thread (normally the IPC worker).
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

  EventBus& eventBus() { return bus_; }
  ContractDirectory& directory() { return directory_; }
  const ITimeProvider& clock() const { return clock_; }

 private:
  // Guard + unit of work + log-on-failure + publish-after-release for admin
  // mutations.
  template <typename Fn>
  void runAdmin(const char* operation, Fn&& fn);

  nlohmann::json dispatch(const nlohmann::json& request);

  const ITimeProvider& clock_;
  const std::string cmd_endpoint_;
  const std::string pub_endpoint_;

  SequenceGenerator sequence_;
  ReentrancyGuard guard_;
  EventBus bus_;
  ContractDirectory directory_;
  AccessControl access_;
  PaymentSettings settings_;
  SaleRegistry registry_;
  PriceOracleAdapter oracle_;
  DisbursementStrategy disbursement_;
  PurchaseEngine purchases_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::optional<EventBus::SubscriptionId> ipc_subscription_;
  bool running_{false};
};

}  // namespace tokensale
