#include "folio/analytics/portfolio_valuator.hpp"

namespace folio {

PortfolioValuator::PortfolioValuator(const InstrumentCatalog& catalog)
    : catalog_(catalog) {}

PortfolioValuation PortfolioValuator::value(
    const domain::PortfolioSnapshot& snapshot) const {
  PortfolioValuation valuation;
  valuation.portfolio = snapshot.portfolio;
  valuation.reserved_cash = snapshot.reserved_cash;

  for (const auto& holding : snapshot.holdings) {
    auto instrument = catalog_.find(holding.instrument_id);
    if (!instrument) {
      valuation.unpriced.push_back(holding);
      continue;
    }

    HoldingValuation entry;
    entry.holding = holding;
    entry.symbol = instrument->symbol;
    entry.asset_class = instrument->asset_class;
    entry.current_price = instrument->current_price;
    entry.market_value =
        static_cast<double>(holding.quantity) * instrument->current_price;
    entry.unrealized_gain =
        static_cast<double>(holding.quantity) *
        (instrument->current_price - holding.average_cost);

    valuation.holdings_value += entry.market_value;
    valuation.holdings.push_back(entry);
  }

  valuation.total_value = snapshot.portfolio.cash + valuation.holdings_value;

  if (valuation.total_value > 0.0) {
    for (auto& entry : valuation.holdings) {
      entry.weight_pct = entry.market_value / valuation.total_value * 100.0;
    }
  }
  return valuation;
}

}  // namespace folio
