#pragma once

#include "folio/domain/instrument.hpp"
#include "folio/domain/risk_profile.hpp"

#include <string>

namespace folio {

// Outcome of a suitability check. reason is empty when suitable.
struct SuitabilityResult {
  bool suitable{true};
  std::string reason;
};

// -----------------------------------------------------------------------------
// SuitabilityChecker
// -----------------------------------------------------------------------------
//
// @brief  Compares an instrument's risk band with a client's risk score.
//
// @details
// Rejects when the client's score is below instrument.risk_rating (the
// instrument needs more risk tolerance than the client has) or above
// instrument.max_risk_score (the instrument is too conservative for the
// mandate). The minimum is checked first.
//
// Runs on every submission, BUY and SELL alike, before any cash or
// concentration check.
//
// Thread model: Stateless; check() is const and may run on any thread.
// -----------------------------------------------------------------------------
class SuitabilityChecker {
 public:
  SuitabilityResult check(const domain::Instrument& instrument,
                          const domain::RiskProfile& profile) const;
};

}  // namespace folio
