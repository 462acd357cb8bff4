#pragma once

#include "tokensale/domain/amount.hpp"

#include <cstdint>

namespace tokensale {

// -----------------------------------------------------------------------------
// RoundData — one answer from a price feed
// -----------------------------------------------------------------------------
// answer is the native-currency price in USD with 8 fractional decimals
// (2'000'00000000 == $2000.00). Feeds report it signed; a non-positive answer
// means the feed has nothing usable.
// -----------------------------------------------------------------------------
struct RoundData {
  std::uint64_t round_id{0};
  domain::SignedAmount answer{0};
  std::uint64_t started_at{0};
  std::uint64_t updated_at{0};
  std::uint64_t answered_in_round{0};
};

// -----------------------------------------------------------------------------
// IPriceFeed — external price source
// -----------------------------------------------------------------------------
// latestAnswer() may throw if the feed is unreachable; PriceOracleAdapter
// converts any such failure into OracleError.
// -----------------------------------------------------------------------------
class IPriceFeed {
 public:
  virtual ~IPriceFeed() = default;

  virtual RoundData latestAnswer() const = 0;
};

}  // namespace tokensale
