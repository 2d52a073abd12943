#include "folio/analytics/drift_calculator.hpp"

#include <cmath>

namespace folio {

namespace {

double percentageOf(const std::map<domain::AssetClass, double>& allocation,
                    domain::AssetClass asset_class) {
  auto it = allocation.find(asset_class);
  return it == allocation.end() ? 0.0 : it->second;
}

}  // namespace

double DriftCalculator::drift(
    const std::map<domain::AssetClass, double>& current,
    const std::map<domain::AssetClass, double>& target) {
  double total = 0.0;
  for (domain::AssetClass asset_class : domain::kAllAssetClasses) {
    if (current.count(asset_class) == 0 && target.count(asset_class) == 0) {
      continue;
    }
    total += std::abs(percentageOf(current, asset_class) -
                      percentageOf(target, asset_class));
  }
  return total / 2.0;
}

}  // namespace folio
