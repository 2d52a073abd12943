#pragma once

#include <array>
#include <optional>
#include <string>

namespace folio {
namespace domain {

// -----------------------------------------------------------------------------
// AssetClass
// -----------------------------------------------------------------------------
// Responsibility: Broad category an instrument belongs to. Allocation and
// drift are computed per asset class; suitability defaults are derived from
// it when an instrument carries no explicit risk rating.
//
// The declaration order is the canonical reporting order used by
// AllocationCalculator.
// -----------------------------------------------------------------------------
enum class AssetClass {
  Equity,
  FixedIncome,
  Cash,
  Alternative,
  RealEstate,
};

// Every asset class in reporting order. Useful for deterministic iteration.
inline constexpr std::array<AssetClass, 5> kAllAssetClasses = {
    AssetClass::Equity, AssetClass::FixedIncome, AssetClass::Cash,
    AssetClass::Alternative, AssetClass::RealEstate};

// Wire / config spelling: "EQUITY", "FIXED_INCOME", "CASH", "ALTERNATIVE",
// "REAL_ESTATE".
const char* assetClassToString(AssetClass asset_class);

// Inverse of assetClassToString(). Returns std::nullopt for unknown names.
std::optional<AssetClass> parseAssetClass(const std::string& name);

// -----------------------------------------------------------------------------
// defaultRiskRating(asset_class)
// -----------------------------------------------------------------------------
// @brief  Minimum client risk score required to hold an instrument of the
//         given class when the instrument does not specify its own rating.
//
// @details
// CASH 0, FIXED_INCOME 1, EQUITY 5, REAL_ESTATE 6, ALTERNATIVE 7.
// -----------------------------------------------------------------------------
int defaultRiskRating(AssetClass asset_class);

}  // namespace domain
}  // namespace folio
