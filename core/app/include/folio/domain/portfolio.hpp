#pragma once

#include "folio/domain/holding.hpp"

#include <string>
#include <vector>

namespace folio {
namespace domain {

// -----------------------------------------------------------------------------
// Portfolio
// -----------------------------------------------------------------------------
//
// @brief  Identity and cash balance of one client account.
//
// @details
// cash is the settled balance and is never negative after a committed
// operation. It is mutated only by fills (CashLedger::commitFill), never
// directly by a caller.
//
// Total value is not stored: it is derived as cash plus the market value of
// all holdings at current catalog prices (see PortfolioSnapshot and
// AllocationCalculator). Storing it would let it drift from the holdings.
// -----------------------------------------------------------------------------
struct Portfolio {
  std::string id;
  std::string client_id;
  double cash{0.0};
  std::string base_currency{"USD"};
};

// -----------------------------------------------------------------------------
// PortfolioSnapshot
// -----------------------------------------------------------------------------
// Consistent copy of a portfolio's cash and holdings taken under the
// portfolio's ledger lock. Analytics and pre-trade checks read snapshots,
// never the live ledger.
// -----------------------------------------------------------------------------
struct PortfolioSnapshot {
  Portfolio portfolio;
  std::vector<Holding> holdings;
  double reserved_cash{0.0};  // Estimated cost of pending BUY orders
};

}  // namespace domain
}  // namespace folio
