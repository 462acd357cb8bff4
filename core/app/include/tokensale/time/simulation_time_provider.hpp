#pragma once

#include "tokensale/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tokensale {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose current time is whatever the harness last set.
//
// @details
// Used by the tests ("sale starts in three days; advance past start_date and
// buy again") and by the node when the configuration pins a start time.
// Purchases evaluate the sale window against now_s() at call time, so moving
// this clock immediately changes which sales are active.
//
// Monotonicity is not enforced; tests occasionally move time backwards to
// check that a window closes again.
//
// Thread model:
//   Lock-free atomic. Any thread may read; any thread may write.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  explicit SimulationTimeProvider(std::uint64_t start_s)
      : current_time_s_(start_s) {}

  std::uint64_t now_s() const override;

  // Sets the clock to an absolute unix time.
  void advance_time(std::uint64_t new_time_s);

  // Moves the clock forward by delta seconds.
  void advance_by(std::uint64_t delta_s);

 private:
  std::atomic<std::uint64_t> current_time_s_{0};
};

}  // namespace tokensale
