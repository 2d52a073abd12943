#include "folio/analytics/allocation_calculator.hpp"

namespace folio {

std::vector<AllocationEntry> AllocationCalculator::calculate(
    const PortfolioValuation& valuation) const {
  std::map<domain::AssetClass, double> totals;
  for (const auto& entry : valuation.holdings) {
    totals[entry.asset_class] += entry.market_value;
  }
  if (valuation.portfolio.cash > 0.0) {
    totals[domain::AssetClass::Cash] += valuation.portfolio.cash;
  }

  double grand_total = 0.0;
  for (const auto& [asset_class, value] : totals) {
    grand_total += value;
  }

  std::vector<AllocationEntry> result;
  if (grand_total <= 0.0) {
    return result;
  }

  for (domain::AssetClass asset_class : domain::kAllAssetClasses) {
    auto it = totals.find(asset_class);
    if (it == totals.end() || it->second <= 0.0) {
      continue;
    }
    AllocationEntry entry;
    entry.asset_class = asset_class;
    entry.value = it->second;
    entry.percentage = it->second / grand_total * 100.0;
    result.push_back(entry);
  }
  return result;
}

std::map<domain::AssetClass, double> AllocationCalculator::toPercentages(
    const std::vector<AllocationEntry>& allocations) {
  std::map<domain::AssetClass, double> percentages;
  for (const auto& entry : allocations) {
    percentages[entry.asset_class] = entry.percentage;
  }
  return percentages;
}

}  // namespace folio
