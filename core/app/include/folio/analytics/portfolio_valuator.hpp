#pragma once

#include "folio/catalog/instrument_catalog.hpp"
#include "folio/domain/asset_class.hpp"
#include "folio/domain/portfolio.hpp"

#include <string>
#include <vector>

namespace folio {

// One holding marked to the current catalog price.
struct HoldingValuation {
  domain::Holding holding;
  std::string symbol;
  domain::AssetClass asset_class{domain::AssetClass::Equity};
  double current_price{0.0};
  double market_value{0.0};
  double unrealized_gain{0.0};  // quantity × (price − average_cost)
  double weight_pct{0.0};       // market_value / total_value × 100
};

// -----------------------------------------------------------------------------
// PortfolioValuation
// -----------------------------------------------------------------------------
// total_value = portfolio.cash + holdings_value. Holdings whose instrument is
// no longer in the catalog are listed in unpriced and excluded from every
// total.
// -----------------------------------------------------------------------------
struct PortfolioValuation {
  domain::Portfolio portfolio;
  std::vector<HoldingValuation> holdings;
  std::vector<domain::Holding> unpriced;
  double holdings_value{0.0};
  double total_value{0.0};
  double reserved_cash{0.0};
};

// -----------------------------------------------------------------------------
// PortfolioValuator
// -----------------------------------------------------------------------------
// Responsibility: Marks a PortfolioSnapshot to market. Shared by the
// allocation calculator, the rebalance advisor and getPortfolio().
//
// Thread model: Stateless apart from the catalog reference; const.
// -----------------------------------------------------------------------------
class PortfolioValuator {
 public:
  explicit PortfolioValuator(const InstrumentCatalog& catalog);

  PortfolioValuation value(const domain::PortfolioSnapshot& snapshot) const;

 private:
  const InstrumentCatalog& catalog_;
};

}  // namespace folio
