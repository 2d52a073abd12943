#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace folio {
namespace domain {

// Questionnaire outcome buckets, lowest to highest tolerance.
enum class RiskCategory {
  Conservative,
  Moderate,
  Balanced,
  Growth,
  Aggressive,
};

const char* riskCategoryToString(RiskCategory category);
std::optional<RiskCategory> parseRiskCategory(const std::string& name);

// -----------------------------------------------------------------------------
// RiskProfile
// -----------------------------------------------------------------------------
// Responsibility: A client's assessed tolerance for risk. Read-only input to
// SuitabilityChecker and ModelPortfolioSelector.
//
// score is an integer in [0, 10]; last_updated_ms is epoch milliseconds and
// drives the staleness recommendation.
// -----------------------------------------------------------------------------
struct RiskProfile {
  std::string client_id;
  int score{0};
  RiskCategory category{RiskCategory::Conservative};
  std::int64_t last_updated_ms{0};
};

// Lowest and highest valid risk scores.
inline constexpr int kMinRiskScore = 0;
inline constexpr int kMaxRiskScore = 10;

}  // namespace domain
}  // namespace folio
