#include "folio/risk/suitability_checker.hpp"

#include <sstream>

namespace folio {

SuitabilityResult SuitabilityChecker::check(
    const domain::Instrument& instrument,
    const domain::RiskProfile& profile) const {
  SuitabilityResult result;

  if (profile.score < instrument.risk_rating) {
    std::ostringstream reason;
    reason << instrument.name << " requires minimum risk score of "
           << instrument.risk_rating << ". Client risk score is "
           << profile.score << ".";
    result.suitable = false;
    result.reason = reason.str();
    return result;
  }

  if (profile.score > instrument.max_risk_score) {
    std::ostringstream reason;
    reason << instrument.name << " is not suitable for risk score "
           << profile.score << " (max " << instrument.max_risk_score << ").";
    result.suitable = false;
    result.reason = reason.str();
    return result;
  }

  return result;
}

}  // namespace folio
