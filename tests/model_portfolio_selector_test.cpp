// =============================================================================
// model_portfolio_selector_test.cpp
// =============================================================================
// Tests for folio::ModelPortfolioSelector with the built-in models
// (bands 0-3, 4, 5, 6-7, 8-10) and with hand-built invalid sets.
// =============================================================================

#include "folio/analytics/model_portfolio_selector.hpp"

#include <gtest/gtest.h>

using folio::ModelPortfolioSelector;
using folio::domain::AssetClass;

namespace {

folio::domain::ModelPortfolio model(const std::string& id, int min, int max) {
  folio::domain::ModelPortfolio m;
  m.id = id;
  m.name = id;
  m.min_risk_score = min;
  m.max_risk_score = max;
  m.targets = {{AssetClass::Equity, 50.0}, {AssetClass::FixedIncome, 50.0}};
  return m;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Every valid score maps to exactly one default model.
// -----------------------------------------------------------------------------
TEST(ModelPortfolioSelectorTest, SelectsByRiskBand) {
  ModelPortfolioSelector selector(folio::domain::defaultModelPortfolios());

  EXPECT_EQ(selector.select(0)->name, "Conservative");
  EXPECT_EQ(selector.select(3)->name, "Conservative");
  EXPECT_EQ(selector.select(4)->name, "Moderate");
  EXPECT_EQ(selector.select(5)->name, "Balanced");
  EXPECT_EQ(selector.select(7)->name, "Growth");
  EXPECT_EQ(selector.select(10)->name, "Aggressive");

  EXPECT_FALSE(selector.select(-1).has_value());
  EXPECT_FALSE(selector.select(11).has_value());
}

// -----------------------------------------------------------------------------
// 2. The built-in set is valid: full coverage, no overlap, targets sum to 100.
// -----------------------------------------------------------------------------
TEST(ModelPortfolioSelectorTest, DefaultModelsAreValid) {
  auto models = folio::domain::defaultModelPortfolios();
  EXPECT_FALSE(ModelPortfolioSelector::validateBands(models).has_value());
  for (const auto& m : models) {
    EXPECT_FALSE(ModelPortfolioSelector::validateTargets(m).has_value())
        << m.id;
  }
}

// -----------------------------------------------------------------------------
// 3. Gaps, overlaps and inverted bands are reported.
// -----------------------------------------------------------------------------
TEST(ModelPortfolioSelectorTest, BandProblems) {
  EXPECT_EQ(ModelPortfolioSelector::validateBands({model("a", 0, 3),
                                                   model("b", 5, 10)}),
            "risk score 4 is not covered by any model");
  EXPECT_EQ(ModelPortfolioSelector::validateBands({model("a", 0, 5),
                                                   model("b", 5, 10)}),
            "risk score 5 is covered by more than one model");
  EXPECT_EQ(ModelPortfolioSelector::validateBands({model("a", 6, 2)}),
            "model 'a' has min_risk_score 6 above max_risk_score 2");
  EXPECT_TRUE(ModelPortfolioSelector::validateBands({}).has_value());
}

// -----------------------------------------------------------------------------
// 4. Targets must be non-negative and sum to 100.
// -----------------------------------------------------------------------------
TEST(ModelPortfolioSelectorTest, TargetProblems) {
  auto m = model("a", 0, 10);
  m.targets[AssetClass::Cash] = 10.0;
  EXPECT_TRUE(ModelPortfolioSelector::validateTargets(m).has_value());

  m.targets = {{AssetClass::Equity, 110.0}, {AssetClass::Cash, -10.0}};
  auto problem = ModelPortfolioSelector::validateTargets(m);
  ASSERT_TRUE(problem.has_value());
  EXPECT_NE(problem->find("negative"), std::string::npos);
}
