#include "tokensale/oracle/price_oracle_adapter.hpp"

#include "tokensale/errors/sale_error.hpp"
#include "tokensale/ledger/contract_directory.hpp"
#include "tokensale/purchase/payment_settings.hpp"

#include <exception>

namespace tokensale {

PriceOracleAdapter::PriceOracleAdapter(const ContractDirectory& directory,
                                       const PaymentSettings& settings)
    : directory_(directory), settings_(settings) {}

domain::Amount PriceOracleAdapter::latestUsdPerNative() const {
  const domain::Address address = settings_.priceOracle();
  if (domain::isZeroAddress(address)) {
    throw OracleError("no price oracle configured");
  }
  auto feed = directory_.priceFeed(address);
  if (!feed) {
    throw OracleError("no price feed registered at '" + address + "'");
  }

  RoundData round;
  try {
    round = feed->latestAnswer();
  } catch (const SaleError&) {
    throw;
  } catch (const std::exception& e) {
    throw OracleError(std::string("price feed failed: ") + e.what());
  }

  if (round.answer <= 0) {
    throw OracleError("price feed answered non-positive value " +
                      domain::formatAmount(round.answer));
  }
  return domain::Amount(round.answer);
}

}  // namespace tokensale
