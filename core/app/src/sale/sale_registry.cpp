#include "tokensale/sale/sale_registry.hpp"

#include "tokensale/access/access_control.hpp"
#include "tokensale/errors/sale_error.hpp"
#include "tokensale/ledger/unit_of_work.hpp"

#include <mutex>
#include <string>
#include <utility>

namespace tokensale {

using domain::Address;
using domain::Amount;
using domain::Sale;
using domain::SaleIndex;

SaleRegistry::SaleRegistry(const AccessControl& access, Address sale_address)
    : access_(access), sale_address_(std::move(sale_address)) {}

// -----------------------------------------------------------------------------
// create(): owner check, validate, append, queue SaleCreated
// -----------------------------------------------------------------------------
SaleIndex SaleRegistry::create(const Address& caller,
                               const domain::SaleParams& params,
                               UnitOfWork& uow) {
  access_.requireOwner(caller, "createSale");
  if (domain::isZeroAddress(params.asset_address)) {
    throw ValidationError("createSale: asset address must not be empty");
  }

  Sale sale;
  sale.asset_address = params.asset_address;
  sale.disbursement =
      domain::makeDisbursement(params.method, params.source_address);
  sale.price_in_usd = params.price_in_usd;
  sale.max_tokens_to_sell = params.max_tokens_to_sell;
  sale.tokens_sold = 0;
  sale.start_date = params.start_date;
  sale.end_date = params.end_date;
  sale.paused = params.paused;

  uow.enlist(*this);
  {
    std::unique_lock lock(mutex_);
    sale.index = sales_.size();
    sales_.push_back(sale);
    journal(UndoEntry{true, sale.index, Sale{}});
  }

  SaleCreatedEvent event;
  event.sale = toRecord(sale, sale_address_);
  uow.emit(std::move(event));
  return sale.index;
}

// -----------------------------------------------------------------------------
// Reads
// -----------------------------------------------------------------------------
Sale SaleRegistry::get(SaleIndex index) const {
  std::shared_lock lock(mutex_);
  if (index >= sales_.size()) {
    throw NotFoundError("sale " + std::to_string(index) + " does not exist");
  }
  return sales_[index];
}

std::size_t SaleRegistry::count() const {
  std::shared_lock lock(mutex_);
  return sales_.size();
}

std::vector<Sale> SaleRegistry::sales() const {
  std::shared_lock lock(mutex_);
  return sales_;
}

// -----------------------------------------------------------------------------
// update(): common path of every administrator setter
// -----------------------------------------------------------------------------
// mutate works on a copy, so a validation failure inside it leaves the stored
// sale untouched.
template <typename Mutator>
void SaleRegistry::update(const Address& caller, const char* operation,
                          SaleIndex index, const char* field, UnitOfWork& uow,
                          Mutator&& mutate) {
  access_.requireOwner(caller, operation);
  uow.enlist(*this);

  Sale updated;
  {
    std::unique_lock lock(mutex_);
    Sale& stored = at(index);
    Sale next = stored;
    mutate(next);
    journal(UndoEntry{false, index, stored});
    stored = std::move(next);
    updated = stored;
  }

  SaleUpdatedEvent event;
  event.sale = toRecord(updated, sale_address_);
  event.field = field;
  uow.emit(std::move(event));
}

void SaleRegistry::setPrice(const Address& caller, SaleIndex index,
                            const Amount& price_in_usd, UnitOfWork& uow) {
  update(caller, "setPrice", index, "price", uow,
         [&](Sale& sale) { sale.price_in_usd = price_in_usd; });
}

void SaleRegistry::setMaxTokens(const Address& caller, SaleIndex index,
                                const Amount& max_tokens, UnitOfWork& uow) {
  update(caller, "setMaxTokens", index, "max_tokens", uow, [&](Sale& sale) {
    if (max_tokens != 0 && max_tokens < sale.tokens_sold) {
      throw ValidationError("setMaxTokens: cap " +
                            domain::formatAmount(max_tokens) +
                            " is below tokens already sold " +
                            domain::formatAmount(sale.tokens_sold));
    }
    sale.max_tokens_to_sell = max_tokens;
  });
}

void SaleRegistry::setStartDate(const Address& caller, SaleIndex index,
                                domain::UnixTime start_date, UnitOfWork& uow) {
  update(caller, "setStartDate", index, "start_date", uow,
         [&](Sale& sale) { sale.start_date = start_date; });
}

void SaleRegistry::setEndDate(const Address& caller, SaleIndex index,
                              domain::UnixTime end_date, UnitOfWork& uow) {
  update(caller, "setEndDate", index, "end_date", uow,
         [&](Sale& sale) { sale.end_date = end_date; });
}

void SaleRegistry::setAssetAddress(const Address& caller, SaleIndex index,
                                   const Address& asset_address,
                                   UnitOfWork& uow) {
  update(caller, "setAssetAddress", index, "asset_address", uow,
         [&](Sale& sale) {
           if (domain::isZeroAddress(asset_address)) {
             throw ValidationError(
                 "setAssetAddress: asset address must not be empty");
           }
           sale.asset_address = asset_address;
         });
}

void SaleRegistry::setPaused(const Address& caller, SaleIndex index,
                             bool paused, UnitOfWork& uow) {
  update(caller, "setPaused", index, "paused", uow,
         [&](Sale& sale) { sale.paused = paused; });
}

// -----------------------------------------------------------------------------
// recordSold(): purchase-path bookkeeping, cap re-checked under the lock
// -----------------------------------------------------------------------------
void SaleRegistry::recordSold(SaleIndex index, const Amount& amount,
                              UnitOfWork& uow) {
  uow.enlist(*this);

  std::unique_lock lock(mutex_);
  Sale& stored = at(index);
  const Amount sold = stored.tokens_sold + amount;
  if (stored.max_tokens_to_sell != 0 && sold > stored.max_tokens_to_sell) {
    throw CapacityExceededError(
        "sale " + std::to_string(index) + ": selling " +
        domain::formatAmount(amount) + " would exceed cap " +
        domain::formatAmount(stored.max_tokens_to_sell));
  }
  journal(UndoEntry{false, index, stored});
  stored.tokens_sold = sold;
}

// -----------------------------------------------------------------------------
// Transaction frames
// -----------------------------------------------------------------------------
void SaleRegistry::begin() {
  std::unique_lock lock(mutex_);
  if (frames_.empty()) {
    frame_owner_ = std::this_thread::get_id();
  }
  frames_.emplace_back();
}

void SaleRegistry::commit() noexcept {
  std::unique_lock lock(mutex_);
  if (frames_.empty()) {
    return;
  }
  auto innermost = std::move(frames_.back());
  frames_.pop_back();
  if (frames_.empty()) {
    frame_owner_ = std::thread::id{};
    return;
  }
  for (auto& entry : innermost) {
    frames_.back().push_back(std::move(entry));
  }
}

void SaleRegistry::rollback() noexcept {
  std::unique_lock lock(mutex_);
  if (frames_.empty()) {
    return;
  }
  auto& frame = frames_.back();
  for (auto it = frame.rbegin(); it != frame.rend(); ++it) {
    if (it->appended) {
      sales_.pop_back();
    } else {
      sales_[it->index] = std::move(it->previous);
    }
  }
  frames_.pop_back();
  if (frames_.empty()) {
    frame_owner_ = std::thread::id{};
  }
}

// -----------------------------------------------------------------------------
// Private helpers (mutex_ held exclusively)
// -----------------------------------------------------------------------------
Sale& SaleRegistry::at(SaleIndex index) {
  if (index >= sales_.size()) {
    throw NotFoundError("sale " + std::to_string(index) + " does not exist");
  }
  return sales_[index];
}

void SaleRegistry::journal(UndoEntry entry) {
  if (frames_.empty() || frame_owner_ != std::this_thread::get_id()) {
    return;
  }
  frames_.back().push_back(std::move(entry));
}

}  // namespace tokensale
