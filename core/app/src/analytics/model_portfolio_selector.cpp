#include "folio/analytics/model_portfolio_selector.hpp"
#include "folio/domain/risk_profile.hpp"

#include <cmath>
#include <utility>

namespace folio {

ModelPortfolioSelector::ModelPortfolioSelector(
    std::vector<domain::ModelPortfolio> models)
    : models_(std::move(models)) {}

std::optional<domain::ModelPortfolio> ModelPortfolioSelector::select(
    int risk_score) const {
  if (risk_score < domain::kMinRiskScore ||
      risk_score > domain::kMaxRiskScore) {
    return std::nullopt;
  }
  for (const auto& model : models_) {
    if (risk_score >= model.min_risk_score &&
        risk_score <= model.max_risk_score) {
      return model;
    }
  }
  return std::nullopt;
}

std::optional<std::string> ModelPortfolioSelector::validateBands(
    const std::vector<domain::ModelPortfolio>& models) {
  if (models.empty()) {
    return std::string("no model portfolios configured");
  }

  for (const auto& model : models) {
    if (model.min_risk_score > model.max_risk_score) {
      return "model '" + model.id + "' has min_risk_score " +
             std::to_string(model.min_risk_score) + " above max_risk_score " +
             std::to_string(model.max_risk_score);
    }
  }

  for (int score = domain::kMinRiskScore; score <= domain::kMaxRiskScore;
       ++score) {
    int matches = 0;
    for (const auto& model : models) {
      if (score >= model.min_risk_score && score <= model.max_risk_score) {
        ++matches;
      }
    }
    if (matches == 0) {
      return "risk score " + std::to_string(score) +
             " is not covered by any model";
    }
    if (matches > 1) {
      return "risk score " + std::to_string(score) +
             " is covered by more than one model";
    }
  }
  return std::nullopt;
}

std::optional<std::string> ModelPortfolioSelector::validateTargets(
    const domain::ModelPortfolio& model) {
  double sum = 0.0;
  for (const auto& [asset_class, pct] : model.targets) {
    if (pct < 0.0) {
      return "model '" + model.id + "' has a negative target for " +
             domain::assetClassToString(asset_class);
    }
    sum += pct;
  }
  if (std::abs(sum - 100.0) > domain::kTargetSumTolerance) {
    return "model '" + model.id + "' targets sum to " + std::to_string(sum) +
           ", expected 100";
  }
  return std::nullopt;
}

}  // namespace folio
