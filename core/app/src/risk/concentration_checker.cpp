#include "folio/risk/concentration_checker.hpp"

namespace folio {

ConcentrationChecker::ConcentrationChecker(double limit_pct)
    : limit_pct_(limit_pct) {}

ConcentrationResult ConcentrationChecker::check(
    const domain::PortfolioSnapshot& snapshot,
    const InstrumentCatalog& catalog, const std::string& instrument_id,
    std::int64_t quantity, double estimated_cost) const {
  ConcentrationResult result;
  result.limit = limit_pct_;

  auto candidate = catalog.find(instrument_id);
  if (!candidate) {
    return result;
  }

  double holdings_value = 0.0;
  std::int64_t held_quantity = 0;
  for (const auto& holding : snapshot.holdings) {
    if (holding.instrument_id == instrument_id) {
      held_quantity = holding.quantity;
      holdings_value +=
          static_cast<double>(holding.quantity) * candidate->current_price;
      continue;
    }
    auto instrument = catalog.find(holding.instrument_id);
    if (instrument) {
      holdings_value +=
          static_cast<double>(holding.quantity) * instrument->current_price;
    }
  }

  double added_value =
      static_cast<double>(quantity) * candidate->current_price;
  double position_after =
      (static_cast<double>(held_quantity) + static_cast<double>(quantity)) *
      candidate->current_price;
  double total_after = snapshot.portfolio.cash + holdings_value -
                       estimated_cost + added_value;

  if (total_after <= 0.0) {
    return result;
  }

  result.resulting_percentage = position_after / total_after * 100.0;
  result.acceptable = result.resulting_percentage <= limit_pct_;
  return result;
}

}  // namespace folio
