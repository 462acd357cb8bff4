#pragma once

#include "tokensale/domain/amount.hpp"
#include "tokensale/domain/sale.hpp"
#include "tokensale/ledger/i_transaction_participant.hpp"

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace tokensale {

class AccessControl;
class UnitOfWork;

// -----------------------------------------------------------------------------
// SaleRegistry — append-only arena of sales
// -----------------------------------------------------------------------------
//
// @brief  Owns every Sale. Indices are positions in the arena: assigned on
//         create(), never reused, never reordered; there is no removal.
//
// @details
// Mutations come from two places only:
//   - administrator setters (owner-gated through AccessControl), each of
//     which queues a SaleUpdated notification carrying the post-mutation
//     record;
//   - recordSold(), called by PurchaseEngine to add to tokens_sold.
//
// The disbursement method is fixed by create(); no setter touches it.
//
// As a transaction participant the registry journals appends and the prior
// value of every modified sale, so a failed purchase or admin mutation
// leaves the arena exactly as it was. Every mutator enlists the registry in
// the unit of work it is handed.
//
// Thread model:
//   Reads take a shared lock and return copies. Mutators take an exclusive
//   lock and must run under the engine's ReentrancyGuard.
// -----------------------------------------------------------------------------
class SaleRegistry final : public ITransactionParticipant {
 public:
  // sale_address is the sale system's custody address, used as the source of
  // Transfer-method sales in notifications.
  SaleRegistry(const AccessControl& access, domain::Address sale_address);

  SaleRegistry(const SaleRegistry&) = delete;
  SaleRegistry& operator=(const SaleRegistry&) = delete;

  // -------------------------------------------------------------------------
  // create
  // -------------------------------------------------------------------------
  // @brief  Appends a sale and queues SaleCreated.
  //
  // @return The new index, equal to the previous count().
  //
  // @throws AuthorizationError  caller is not the administrator.
  //         ValidationError     empty asset address, or TransferFrom without
  //                             a source address.
  // -------------------------------------------------------------------------
  domain::SaleIndex create(const domain::Address& caller,
                           const domain::SaleParams& params, UnitOfWork& uow);

  // @throws NotFoundError if index >= count().
  domain::Sale get(domain::SaleIndex index) const;

  std::size_t count() const;

  // Snapshot of every sale in index order.
  std::vector<domain::Sale> sales() const;

  const domain::Address& saleAddress() const { return sale_address_; }

  // --- Administrator setters ------------------------------------------------
  // Each throws AuthorizationError for a non-administrator caller and
  // NotFoundError for an unknown index, then queues SaleUpdated.

  void setPrice(const domain::Address& caller, domain::SaleIndex index,
                const domain::Amount& price_in_usd, UnitOfWork& uow);

  // @throws ValidationError if the new non-zero cap is below tokens_sold.
  void setMaxTokens(const domain::Address& caller, domain::SaleIndex index,
                    const domain::Amount& max_tokens, UnitOfWork& uow);

  void setStartDate(const domain::Address& caller, domain::SaleIndex index,
                    domain::UnixTime start_date, UnitOfWork& uow);

  void setEndDate(const domain::Address& caller, domain::SaleIndex index,
                  domain::UnixTime end_date, UnitOfWork& uow);

  // @throws ValidationError if asset_address is empty.
  void setAssetAddress(const domain::Address& caller, domain::SaleIndex index,
                       const domain::Address& asset_address, UnitOfWork& uow);

  void setPaused(const domain::Address& caller, domain::SaleIndex index,
                 bool paused, UnitOfWork& uow);

  // -------------------------------------------------------------------------
  // recordSold
  // -------------------------------------------------------------------------
  // @brief  Adds amount to tokens_sold. Purchase path only.
  //
  // @throws NotFoundError          unknown index.
  //         CapacityExceededError  the addition would pass a non-zero cap.
  // -------------------------------------------------------------------------
  void recordSold(domain::SaleIndex index, const domain::Amount& amount,
                  UnitOfWork& uow);

  // --- ITransactionParticipant ----------------------------------------------
  void begin() override;
  void commit() noexcept override;
  void rollback() noexcept override;

 private:
  struct UndoEntry {
    bool appended{false};
    domain::SaleIndex index{0};
    domain::Sale previous;
  };

  // Shared tail of every setter: owner check, lookup, journal, mutate,
  // emit SaleUpdated(field).
  template <typename Mutator>
  void update(const domain::Address& caller, const char* operation,
              domain::SaleIndex index, const char* field, UnitOfWork& uow,
              Mutator&& mutate);

  // Caller holds mutex_ exclusively.
  domain::Sale& at(domain::SaleIndex index);
  void journal(UndoEntry entry);

  const AccessControl& access_;
  const domain::Address sale_address_;

  mutable std::shared_mutex mutex_;
  std::vector<domain::Sale> sales_;

  std::vector<std::vector<UndoEntry>> frames_;
  std::thread::id frame_owner_;
};

}  // namespace tokensale
