#include "tokensale/oracle/fixed_price_feed.hpp"

#include <utility>

namespace tokensale {

FixedPriceFeed::FixedPriceFeed(domain::SignedAmount answer,
                               std::uint64_t updated_at) {
  round_.round_id = 1;
  round_.answer = std::move(answer);
  round_.started_at = updated_at;
  round_.updated_at = updated_at;
  round_.answered_in_round = 1;
}

RoundData FixedPriceFeed::latestAnswer() const {
  std::lock_guard lock(mutex_);
  return round_;
}

void FixedPriceFeed::setAnswer(domain::SignedAmount answer,
                               std::uint64_t updated_at) {
  std::lock_guard lock(mutex_);
  ++round_.round_id;
  round_.answer = std::move(answer);
  round_.started_at = updated_at;
  round_.updated_at = updated_at;
  round_.answered_in_round = round_.round_id;
}

}  // namespace tokensale
