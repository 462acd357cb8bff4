#pragma once

#include <cstdint>

namespace tokensale {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  The engine's notion of "now", injected rather than read from
//         std::chrono directly.
//
// @details
// Sale windows are unix-second bounds, and ActiveSaleGuard evaluates them at
// the instant of every purchase. Injecting the clock lets tests move time
// across a sale's start_date without sleeping, and lets the node run against
// a simulated timeline.
//
//   - LiveTimeProvider        system clock
//   - SimulationTimeProvider  value set by the test / harness
//
// Thread-safety contract:
//   now_s() must be safe to call concurrently from any thread.
//
// Ownership:
//   Components hold a const reference. The provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_s()
  // -------------------------------------------------------------------------
  // @brief  Current time as seconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::uint64_t now_s() const = 0;
};

}  // namespace tokensale
