#pragma once

#include "tokensale/oracle/i_price_feed.hpp"

#include <mutex>

namespace tokensale {

// -----------------------------------------------------------------------------
// FixedPriceFeed — settable IPriceFeed for the simulated ledger and tests
// -----------------------------------------------------------------------------
// Every setAnswer() starts a new round. Thread-safe.
// -----------------------------------------------------------------------------
class FixedPriceFeed final : public IPriceFeed {
 public:
  explicit FixedPriceFeed(domain::SignedAmount answer,
                          std::uint64_t updated_at = 0);

  RoundData latestAnswer() const override;

  void setAnswer(domain::SignedAmount answer, std::uint64_t updated_at);

 private:
  mutable std::mutex mutex_;
  RoundData round_;
};

}  // namespace tokensale
