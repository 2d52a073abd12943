#include "folio/domain/model_portfolio.hpp"

#include <utility>

namespace folio {
namespace domain {

namespace {

ModelPortfolio makeModel(std::string id, std::string name,
                         std::string description, int min_score,
                         int max_score, double equity, double fixed_income,
                         double cash, double alternative) {
  ModelPortfolio m;
  m.id = std::move(id);
  m.name = std::move(name);
  m.description = std::move(description);
  m.min_risk_score = min_score;
  m.max_risk_score = max_score;
  m.targets[AssetClass::Equity] = equity;
  m.targets[AssetClass::FixedIncome] = fixed_income;
  m.targets[AssetClass::Cash] = cash;
  m.targets[AssetClass::Alternative] = alternative;
  return m;
}

}  // namespace

// -----------------------------------------------------------------------------
// defaultModelPortfolios(): bands 0-3, 4, 5, 6-7, 8-10
// -----------------------------------------------------------------------------
std::vector<ModelPortfolio> defaultModelPortfolios() {
  return {
      makeModel("mp-1", "Conservative",
                "Capital preservation with modest growth", 0, 3,
                20.0, 65.0, 10.0, 5.0),
      makeModel("mp-2", "Moderate",
                "Balanced approach with stability focus", 4, 4,
                40.0, 50.0, 5.0, 5.0),
      makeModel("mp-3", "Balanced",
                "Equal emphasis on growth and stability", 5, 5,
                60.0, 30.0, 5.0, 5.0),
      makeModel("mp-4", "Growth",
                "Growth-oriented with measured risk", 6, 7,
                75.0, 15.0, 5.0, 5.0),
      makeModel("mp-5", "Aggressive", "Maximum growth potential", 8, 10,
                90.0, 5.0, 2.0, 3.0),
  };
}

}  // namespace domain
}  // namespace folio
