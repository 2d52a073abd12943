#pragma once

#include "folio/analytics/drift_calculator.hpp"
#include "folio/analytics/portfolio_valuator.hpp"
#include "folio/domain/engine_limits.hpp"
#include "folio/domain/risk_profile.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace folio {

enum class RecommendationType {
  RefreshRiskProfile,
  RebalancePortfolio,
  InvestCash,
  ReduceConcentration,
};

enum class RecommendationPriority {
  High,
  Medium,
  Low,
};

// "REFRESH_RISK_PROFILE", ... / "HIGH", "MEDIUM", "LOW".
const char* recommendationTypeToString(RecommendationType type);
const char* recommendationPriorityToString(RecommendationPriority priority);

// -----------------------------------------------------------------------------
// Recommendation
// -----------------------------------------------------------------------------
// metric is the number that triggered it: days since the profile update,
// drift percentage, cash percentage, or the holding's weight. instrument_id
// is set for ReduceConcentration only.
// -----------------------------------------------------------------------------
struct Recommendation {
  RecommendationType type{RecommendationType::RebalancePortfolio};
  RecommendationPriority priority{RecommendationPriority::Medium};
  std::string title;
  std::string description;
  double metric{0.0};
  std::optional<std::string> instrument_id;
};

// -----------------------------------------------------------------------------
// RebalanceAdvisor — portfolio health checks
// -----------------------------------------------------------------------------
//
// @brief  Turns a valuation, the client's risk profile, and the drift
//         against the selected model into a list of recommendations.
//
// @details
// Rules, emitted in this order:
//
//   REFRESH_RISK_PROFILE  HIGH    profile older than risk_profile_stale_days
//   REBALANCE_PORTFOLIO   HIGH    drift > high_drift_threshold
//                         MEDIUM  drift > rebalance_drift_threshold
//   INVEST_CASH           MEDIUM  cash % > high_idle_cash_pct
//                         LOW     cash % > idle_cash_pct
//   REDUCE_CONCENTRATION  HIGH    one per holding whose weight exceeds
//                                 concentration_advisory_pct
//
// Missing inputs skip their rule: no profile means no staleness check, no
// drift (no model matched) means no rebalance check, and a portfolio with
// zero total value gets neither cash nor concentration advice.
//
// Thread model: Immutable after construction; advise() is const.
// -----------------------------------------------------------------------------
class RebalanceAdvisor {
 public:
  explicit RebalanceAdvisor(const domain::EngineLimits& limits);

  std::vector<Recommendation> advise(
      const PortfolioValuation& valuation,
      const std::optional<domain::RiskProfile>& profile,
      const std::optional<DriftResult>& drift, std::int64_t now_ms) const;

 private:
  const domain::EngineLimits limits_;
};

}  // namespace folio
