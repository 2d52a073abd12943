#pragma once

#include "folio/domain/asset_class.hpp"

#include <map>
#include <string>
#include <vector>

namespace folio {
namespace domain {

// -----------------------------------------------------------------------------
// ModelPortfolio
// -----------------------------------------------------------------------------
//
// @brief  A named target allocation associated with a band of risk scores.
//
// @details
// targets maps asset class → target percentage. The percentages sum to 100
// within kTargetSumTolerance; parseEngineConfig() rejects models that do
// not.
//
// [min_risk_score, max_risk_score] is inclusive. Across the loaded set the
// bands partition 0-10 without gaps or overlaps, so exactly one model
// matches any valid score (see ModelPortfolioSelector).
// -----------------------------------------------------------------------------
struct ModelPortfolio {
  std::string id;
  std::string name;
  std::string description;
  int min_risk_score{0};
  int max_risk_score{0};
  std::map<AssetClass, double> targets;
};

inline constexpr double kTargetSumTolerance = 0.01;

// The five built-in models (Conservative, Moderate, Balanced, Growth,
// Aggressive) used when the configuration does not provide its own.
std::vector<ModelPortfolio> defaultModelPortfolios();

}  // namespace domain
}  // namespace folio
