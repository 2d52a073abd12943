#pragma once

#include "folio/catalog/instrument_catalog.hpp"
#include "folio/domain/portfolio.hpp"

#include <cstdint>
#include <string>

namespace folio {

// -----------------------------------------------------------------------------
// ConcentrationResult
// -----------------------------------------------------------------------------
// resulting_percentage is the weight the instrument would have after the
// hypothetical fill, on a 0-100 scale. limit echoes the configured cap so
// callers can report both.
// -----------------------------------------------------------------------------
struct ConcentrationResult {
  bool acceptable{true};
  double resulting_percentage{0.0};
  double limit{0.0};
};

// -----------------------------------------------------------------------------
// ConcentrationChecker — single-instrument weight cap for BUY orders
// -----------------------------------------------------------------------------
//
// @brief  Computes what share of the portfolio one instrument would be
//         after a BUY fills, and compares it with a fixed limit.
//
// @details
// Valuation uses current catalog prices; holdings whose instrument is no
// longer in the catalog contribute nothing.
//
//   position_after = (held_quantity + quantity) × price
//   total_after    = cash + Σ holdings value − estimated_cost
//                    + quantity × price
//   resulting_%    = position_after / total_after × 100
//
// Cash leaves the portfolio at the estimated cost (the limit price for a
// LIMIT order) while the new units are valued at the market price, so the
// total changes when the two differ. A non-positive total_after yields 0%.
// The limit is inclusive.
//
// An unknown candidate instrument is reported as acceptable with 0%; the
// caller resolves the instrument before this check runs.
//
// A failed check blocks order creation: no Pending order exists for a
// concentration rejection.
//
// Thread model: Immutable after construction; check() is const.
// -----------------------------------------------------------------------------
class ConcentrationChecker {
 public:
  explicit ConcentrationChecker(double limit_pct);

  ConcentrationResult check(const domain::PortfolioSnapshot& snapshot,
                            const InstrumentCatalog& catalog,
                            const std::string& instrument_id,
                            std::int64_t quantity,
                            double estimated_cost) const;

  double limit() const { return limit_pct_; }

 private:
  double limit_pct_;
};

}  // namespace folio
