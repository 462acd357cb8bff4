#include "tokensale/sale/active_sale_guard.hpp"

namespace tokensale {

bool ActiveSaleGuard::isActive(const domain::Sale& sale, domain::UnixTime now) {
  return inactiveReason(sale, now) == nullptr;
}

const char* ActiveSaleGuard::inactiveReason(const domain::Sale& sale,
                                            domain::UnixTime now) {
  if (sale.paused) {
    return "paused";
  }
  if (sale.start_date != 0 && now < sale.start_date) {
    return "not started";
  }
  if (sale.end_date != 0 && now >= sale.end_date) {
    return "ended";
  }
  return nullptr;
}

}  // namespace tokensale
