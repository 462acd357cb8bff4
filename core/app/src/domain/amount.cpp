#include "tokensale/domain/amount.hpp"
#include "tokensale/errors/sale_error.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace tokensale {
namespace domain {

namespace {

// 78 digits is the widest 256-bit unsigned value (2^256 ~ 1.16e77).
constexpr std::size_t kMaxDigits = 78;

bool allDigits(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
           return std::isdigit(c) != 0;
         });
}

// cpp_int reads a leading 0 as an octal prefix; strip it before parsing.
std::string withoutLeadingZeros(const std::string& digits) {
  const auto first = digits.find_first_not_of('0');
  return first == std::string::npos ? std::string("0") : digits.substr(first);
}

}  // namespace

Amount parseAmount(const std::string& text) {
  if (!allDigits(text) || text.size() > kMaxDigits) {
    throw ValidationError("invalid amount: '" + text + "'");
  }
  try {
    return Amount(withoutLeadingZeros(text));
  } catch (const std::range_error&) {
    throw ValidationError("amount out of range: " + text);
  } catch (const std::overflow_error&) {
    throw ValidationError("amount out of range: " + text);
  }
}

SignedAmount parseSignedAmount(const std::string& text) {
  bool negative = !text.empty() && text.front() == '-';
  std::string digits = negative ? text.substr(1) : text;
  if (!allDigits(digits) || digits.size() > kMaxDigits) {
    throw ValidationError("invalid signed amount: '" + text + "'");
  }
  try {
    SignedAmount magnitude(withoutLeadingZeros(digits));
    return negative ? SignedAmount(-magnitude) : magnitude;
  } catch (const std::range_error&) {
    throw ValidationError("signed amount out of range: " + text);
  } catch (const std::overflow_error&) {
    throw ValidationError("signed amount out of range: " + text);
  }
}

std::string formatAmount(const Amount& value) { return value.str(); }

std::string formatAmount(const SignedAmount& value) { return value.str(); }

Amount scaled(std::uint64_t whole, unsigned decimals) {
  Amount result(whole);
  for (unsigned i = 0; i < decimals; ++i) {
    result *= 10u;
  }
  return result;
}

}  // namespace domain
}  // namespace tokensale
