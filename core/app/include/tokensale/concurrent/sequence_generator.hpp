#pragma once

#include <atomic>
#include <cstdint>

namespace tokensale {

// -----------------------------------------------------------------------------
// SequenceGenerator — monotonically increasing notification sequence ids
// -----------------------------------------------------------------------------
//
// @brief  Hands out 1, 2, 3, ... to every notification queued by a UnitOfWork,
//         giving subscribers (and IPC consumers) a total order over
//         SaleCreated / SaleUpdated / TokensBought.
//
// @details
// 0 is reserved as "not stamped". Ids consumed by a unit of work that later
// rolls back are not reissued, so consumers see gaps but never duplicates.
//
// Thread model:
//   next_id() is safe from any thread. Relaxed ordering is enough: the only
//   requirement is uniqueness and per-generator monotonicity.
//
// Ownership:
//   Value member of SaleEngine; passed by reference into every UnitOfWork.
// -----------------------------------------------------------------------------
class SequenceGenerator {
 public:
  SequenceGenerator() = default;

  SequenceGenerator(const SequenceGenerator&) = delete;
  SequenceGenerator& operator=(const SequenceGenerator&) = delete;
  SequenceGenerator(SequenceGenerator&&) = delete;
  SequenceGenerator& operator=(SequenceGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace tokensale
