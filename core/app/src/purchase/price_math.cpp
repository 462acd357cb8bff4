#include "tokensale/purchase/price_math.hpp"

#include "tokensale/errors/sale_error.hpp"

#include <stdexcept>

namespace tokensale {
namespace pricing {

using domain::Amount;

namespace {

template <typename Fn>
Amount checked(const char* what, Fn&& fn) {
  try {
    return fn();
  } catch (const std::overflow_error& e) {
    throw ValidationError(std::string(what) + " overflows: " + e.what());
  } catch (const std::range_error& e) {
    throw ValidationError(std::string(what) + " out of range: " + e.what());
  }
}

}  // namespace

Amount usdCost(const Amount& amount, const Amount& price_in_usd) {
  return checked("usd cost", [&] {
    return Amount(amount * price_in_usd / domain::kAssetScale);
  });
}

Amount usdValueOfNative(const Amount& native_sent, const Amount& rate) {
  return checked("native value", [&] {
    return Amount(native_sent * rate / domain::kOracleScale);
  });
}

Amount assetAmountForUsd(const Amount& usd_value, const Amount& price_in_usd) {
  if (price_in_usd == 0) {
    throw ValidationError("sale price is zero");
  }
  return checked("asset amount", [&] {
    return Amount(usd_value * domain::kUsdScale / price_in_usd);
  });
}

}  // namespace pricing
}  // namespace tokensale
