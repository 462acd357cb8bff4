#include "tokensale/time/live_time_provider.hpp"

#include <chrono>

namespace tokensale {

// -----------------------------------------------------------------------------
// now_s(): system clock, truncated to seconds since epoch
// -----------------------------------------------------------------------------
std::uint64_t LiveTimeProvider::now_s() const {
  auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  auto seconds =
      std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count();
  return seconds < 0 ? 0 : static_cast<std::uint64_t>(seconds);
}

}  // namespace tokensale
