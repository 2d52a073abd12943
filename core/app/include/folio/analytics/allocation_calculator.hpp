#pragma once

#include "folio/analytics/portfolio_valuator.hpp"
#include "folio/domain/asset_class.hpp"

#include <map>
#include <vector>

namespace folio {

struct AllocationEntry {
  domain::AssetClass asset_class{domain::AssetClass::Equity};
  double value{0.0};
  double percentage{0.0};
};

// -----------------------------------------------------------------------------
// AllocationCalculator — value and weight per asset class
// -----------------------------------------------------------------------------
//
// @brief  Sums holding market values by asset class, adds the portfolio's
//         cash to the CASH bucket, and expresses each class as a percentage
//         of the grand total.
//
// @details
// Entries are ordered by AssetClass declaration order and only classes
// with a positive value appear. Percentages of a non-empty result sum to
// 100 up to floating-point rounding. A portfolio whose cash and holdings
// are all worth zero produces an empty list.
//
// Thread model: const; safe from any thread.
// -----------------------------------------------------------------------------
class AllocationCalculator {
 public:
  std::vector<AllocationEntry> calculate(
      const PortfolioValuation& valuation) const;

  // Convenience for DriftCalculator: asset class → percentage.
  static std::map<domain::AssetClass, double> toPercentages(
      const std::vector<AllocationEntry>& allocations);
};

}  // namespace folio
