#include "folio/analytics/rebalance_advisor.hpp"
#include "folio/catalog/risk_profile_registry.hpp"
#include "folio/time/i_time_provider.hpp"

#include <iomanip>
#include <sstream>

namespace folio {

namespace {

std::string formatPct(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << value << "%";
  return out.str();
}

}  // namespace

const char* recommendationTypeToString(RecommendationType type) {
  switch (type) {
    case RecommendationType::RefreshRiskProfile:
      return "REFRESH_RISK_PROFILE";
    case RecommendationType::RebalancePortfolio:
      return "REBALANCE_PORTFOLIO";
    case RecommendationType::InvestCash:
      return "INVEST_CASH";
    case RecommendationType::ReduceConcentration:
      return "REDUCE_CONCENTRATION";
  }
  return "UNKNOWN";
}

const char* recommendationPriorityToString(RecommendationPriority priority) {
  switch (priority) {
    case RecommendationPriority::High:
      return "HIGH";
    case RecommendationPriority::Medium:
      return "MEDIUM";
    case RecommendationPriority::Low:
      return "LOW";
  }
  return "UNKNOWN";
}

RebalanceAdvisor::RebalanceAdvisor(const domain::EngineLimits& limits)
    : limits_(limits) {}

std::vector<Recommendation> RebalanceAdvisor::advise(
    const PortfolioValuation& valuation,
    const std::optional<domain::RiskProfile>& profile,
    const std::optional<DriftResult>& drift, std::int64_t now_ms) const {
  std::vector<Recommendation> result;

  // --- Stale risk profile ---------------------------------------------------
  if (profile && RiskProfileRegistry::isStale(*profile, now_ms,
                                              limits_.risk_profile_stale_days)) {
    Recommendation rec;
    rec.type = RecommendationType::RefreshRiskProfile;
    rec.priority = RecommendationPriority::High;
    rec.metric = static_cast<double>(now_ms - profile->last_updated_ms) /
                 static_cast<double>(kMillisPerDay);
    rec.title = "Update your risk profile";
    rec.description = "Your risk profile was last updated " +
                      std::to_string(static_cast<long long>(rec.metric)) +
                      " days ago. Review it so recommendations match your "
                      "current situation.";
    result.push_back(rec);
  }

  // --- Drift against the model ----------------------------------------------
  if (drift && drift->drift_percentage > limits_.rebalance_drift_threshold) {
    Recommendation rec;
    rec.type = RecommendationType::RebalancePortfolio;
    rec.priority = drift->drift_percentage > limits_.high_drift_threshold
                       ? RecommendationPriority::High
                       : RecommendationPriority::Medium;
    rec.metric = drift->drift_percentage;
    rec.title = "Rebalance your portfolio";
    rec.description = "Your allocation has drifted " +
                      formatPct(drift->drift_percentage) + " from the " +
                      drift->model_name + " model.";
    result.push_back(rec);
  }

  if (valuation.total_value <= 0.0) {
    return result;
  }

  // --- Idle cash --------------------------------------------------------------
  const double cash_pct = valuation.portfolio.cash / valuation.total_value * 100.0;
  if (cash_pct > limits_.idle_cash_pct) {
    Recommendation rec;
    rec.type = RecommendationType::InvestCash;
    rec.priority = cash_pct > limits_.high_idle_cash_pct
                       ? RecommendationPriority::Medium
                       : RecommendationPriority::Low;
    rec.metric = cash_pct;
    rec.title = "Invest idle cash";
    rec.description = formatPct(cash_pct) +
                      " of your portfolio is held in cash.";
    result.push_back(rec);
  }

  // --- Single-holding concentration -------------------------------------------
  for (const auto& holding : valuation.holdings) {
    if (holding.weight_pct <= limits_.concentration_advisory_pct) {
      continue;
    }
    Recommendation rec;
    rec.type = RecommendationType::ReduceConcentration;
    rec.priority = RecommendationPriority::High;
    rec.metric = holding.weight_pct;
    rec.instrument_id = holding.holding.instrument_id;
    rec.title = "Reduce concentration in " + holding.symbol;
    rec.description = holding.symbol + " makes up " +
                      formatPct(holding.weight_pct) +
                      " of your portfolio. Consider diversifying.";
    result.push_back(rec);
  }

  return result;
}

}  // namespace folio
