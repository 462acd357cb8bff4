#include "tokensale/events/sale_events.hpp"

namespace tokensale {

SaleRecord toRecord(const domain::Sale& sale,
                    const domain::Address& sale_address) {
  SaleRecord record;
  record.index = sale.index;
  record.asset_address = sale.asset_address;
  record.price_in_usd = sale.price_in_usd;
  record.max_tokens_to_sell = sale.max_tokens_to_sell;
  record.tokens_sold = sale.tokens_sold;
  record.start_date = sale.start_date;
  record.end_date = sale.end_date;
  record.paused = sale.paused;
  record.method = domain::methodOf(sale.disbursement);
  record.source_address = domain::sourceOf(sale, sale_address);
  return record;
}

}  // namespace tokensale
