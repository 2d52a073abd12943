#pragma once

#include "folio/domain/asset_class.hpp"

#include <string>

namespace folio {
namespace domain {

// -----------------------------------------------------------------------------
// Instrument — a tradable security
// -----------------------------------------------------------------------------
//
// @brief  Static description of a tradable instrument plus its last known
//         price.
//
// @details
// Every field is immutable after the instrument is registered with the
// InstrumentCatalog, except current_price, which is refreshed externally
// through InstrumentCatalog::updatePrice().
//
// Suitability band:
//   risk_rating     Minimum client risk score (0-10) required to trade it.
//   max_risk_score  Maximum client risk score for which it is considered
//                   suitable (10 = no upper bound).
//
// Thread model:
//   Value type. The catalog hands out copies; callers never see the
//   catalog's internal storage.
// -----------------------------------------------------------------------------
struct Instrument {
  std::string id;                          // Catalog key (e.g. "ins-1")
  std::string symbol;                      // Ticker (e.g. "VTI")
  std::string name;                        // Display name
  AssetClass asset_class{AssetClass::Equity};
  double current_price{0.0};               // Last price, always >= 0
  int risk_rating{0};                      // Minimum suitable risk score
  int max_risk_score{10};                  // Maximum suitable risk score
  std::string description;
};

}  // namespace domain
}  // namespace folio
