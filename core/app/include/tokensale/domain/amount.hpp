#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <string>

namespace tokensale {
namespace domain {

// -----------------------------------------------------------------------------
// Amount / SignedAmount
// -----------------------------------------------------------------------------
//
// @brief  Fixed-width 256-bit integers used for every quantity in the system:
//         asset units (18 decimals), USD prices and costs (6 decimals), native
//         currency (18 decimals) and oracle answers (8 decimals).
//
// @details
// A purchase of 100 whole asset units is 100 * 10^18 base units, which is
// already larger than std::uint64_t can hold, and the cost computation
// multiplies that by a 6-decimal price before dividing. The checked backends
// throw std::overflow_error / std::range_error instead of wrapping, so an
// out-of-range computation aborts the enclosing unit of work.
//
// SignedAmount exists only for price-feed answers, which the feed interface
// reports as signed values.
// -----------------------------------------------------------------------------
using Amount = boost::multiprecision::checked_uint256_t;
using SignedAmount = boost::multiprecision::checked_int256_t;

// -----------------------------------------------------------------------------
// Address
// -----------------------------------------------------------------------------
// Opaque account / contract identifier. The empty string is the zero address:
// "unset" for configuration slots and never a valid owner or asset.
// -----------------------------------------------------------------------------
using Address = std::string;

inline bool isZeroAddress(const Address& address) { return address.empty(); }

// --- Decimal precision of every quantity kind --------------------------------
constexpr unsigned kAssetDecimals = 18;
constexpr unsigned kUsdDecimals = 6;
constexpr unsigned kOracleDecimals = 8;

// 10^decimals for the three precisions above. All fit in 64 bits.
constexpr std::uint64_t kAssetScale = 1'000'000'000'000'000'000ULL;
constexpr std::uint64_t kUsdScale = 1'000'000ULL;
constexpr std::uint64_t kOracleScale = 100'000'000ULL;

// -------------------------------------------------------------------------
// parseAmount
// -------------------------------------------------------------------------
// @brief  Parses a non-negative decimal string ("1500000") into an Amount.
//
// @throws ValidationError if the string is empty, contains anything other
//         than ASCII digits, or does not fit in 256 bits.
// -------------------------------------------------------------------------
Amount parseAmount(const std::string& text);

// Parses an optionally '-'-prefixed decimal string. Same failure modes.
SignedAmount parseSignedAmount(const std::string& text);

// Decimal rendering, no separators, no leading zeros.
std::string formatAmount(const Amount& value);
std::string formatAmount(const SignedAmount& value);

// Convenience for literals in tests and config: whole * 10^decimals.
Amount scaled(std::uint64_t whole, unsigned decimals);

}  // namespace domain
}  // namespace tokensale
