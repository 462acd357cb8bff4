#pragma once

#include "tokensale/time/i_time_provider.hpp"

namespace tokensale {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
// Truncates std::chrono::system_clock::now() to whole unix seconds, the unit
// of a sale's start_date / end_date. Stateless; safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::uint64_t now_s() const override;
};

}  // namespace tokensale
