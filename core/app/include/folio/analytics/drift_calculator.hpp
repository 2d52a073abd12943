#pragma once

#include "folio/domain/asset_class.hpp"

#include <map>
#include <string>

namespace folio {

struct DriftResult {
  std::string model_id;
  std::string model_name;
  double drift_percentage{0.0};
};

// -----------------------------------------------------------------------------
// DriftCalculator
// -----------------------------------------------------------------------------
// drift = Σ |current[c] − target[c]| / 2 over the union of asset classes
// present on either side; a class missing from one side counts as 0%.
//
// Halving makes the result the share of the portfolio that would have to
// move to reach the target, bounded in [0, 100] when both sides sum to 100.
// Symmetric in its arguments; drift(a, a) == 0.
// -----------------------------------------------------------------------------
class DriftCalculator {
 public:
  static double drift(const std::map<domain::AssetClass, double>& current,
                      const std::map<domain::AssetClass, double>& target);
};

}  // namespace folio
