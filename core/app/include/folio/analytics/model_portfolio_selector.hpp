#pragma once

#include "folio/domain/model_portfolio.hpp"

#include <optional>
#include <string>
#include <vector>

namespace folio {

// -----------------------------------------------------------------------------
// ModelPortfolioSelector — risk score → target model
// -----------------------------------------------------------------------------
//
// @brief  Returns the model whose [min_risk_score, max_risk_score] band
//         contains the score.
//
// @details
// The configured models are expected to partition 0-10 with no gaps and
// no overlaps (validateBands() checks this at configuration time). With a
// valid set exactly one model matches any score in range. A score outside
// 0-10, or an empty model list, selects nothing.
//
// Thread model: Immutable after construction.
// -----------------------------------------------------------------------------
class ModelPortfolioSelector {
 public:
  explicit ModelPortfolioSelector(std::vector<domain::ModelPortfolio> models);

  std::optional<domain::ModelPortfolio> select(int risk_score) const;

  const std::vector<domain::ModelPortfolio>& models() const { return models_; }

  // -------------------------------------------------------------------------
  // validateBands(models)
  // -------------------------------------------------------------------------
  // @return std::nullopt when the bands cover every score 0-10 exactly once
  //         and each band has min ≤ max; otherwise a description of the
  //         first problem found.
  // -------------------------------------------------------------------------
  static std::optional<std::string> validateBands(
      const std::vector<domain::ModelPortfolio>& models);

  // Targets must be non-negative and sum to 100 ± kTargetSumTolerance.
  static std::optional<std::string> validateTargets(
      const domain::ModelPortfolio& model);

 private:
  std::vector<domain::ModelPortfolio> models_;
};

}  // namespace folio
