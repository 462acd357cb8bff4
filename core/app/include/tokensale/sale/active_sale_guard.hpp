#pragma once

#include "tokensale/domain/sale.hpp"

namespace tokensale {

// -----------------------------------------------------------------------------
// ActiveSaleGuard
// -----------------------------------------------------------------------------
// Pure predicate over a sale's pause flag and time window:
//
//   paused                          -> inactive
//   start_date != 0 && now < start  -> inactive (not started)
//   end_date   != 0 && now >= end   -> inactive (ended)
//   otherwise                       -> active
//
// Evaluated at the instant of every purchase; nothing is cached.
// -----------------------------------------------------------------------------
class ActiveSaleGuard {
 public:
  static bool isActive(const domain::Sale& sale, domain::UnixTime now);

  // Human-readable reason the sale is inactive, or nullptr if it is active.
  static const char* inactiveReason(const domain::Sale& sale,
                                    domain::UnixTime now);
};

}  // namespace tokensale
