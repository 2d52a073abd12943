#pragma once

#include "folio/domain/order.hpp"

#include <cstdint>
#include <optional>

namespace folio {

// -----------------------------------------------------------------------------
// CashCheck
// -----------------------------------------------------------------------------
// Result of a sufficiency check. available is cash net of what pending BUY
// orders have already reserved; required is the estimated cost asked for.
// -----------------------------------------------------------------------------
struct CashCheck {
  bool sufficient{false};
  double available{0.0};
  double required{0.0};
};

// -----------------------------------------------------------------------------
// CashLedger — settled cash and pending reservations of one portfolio
// -----------------------------------------------------------------------------
//
// @brief  Answers "can this portfolio pay for a BUY?" and moves cash when a
//         fill commits.
//
// @details
// Two balances are tracked:
//
//   cash_      settled balance. Changes only through commit(), which is
//              driven by a fill. Never negative after a commit.
//   reserved_  sum of the estimated costs of accepted BUY orders that are
//              still PENDING. Reserved at submission, released when the
//              order reaches a terminal state.
//
//   available = max(cash − reserved, 0)
//
// A fill is applied in two steps so PortfolioLedger can make it atomic with
// the HoldingsBook mutation: projectFill() computes the balance the fill
// would leave without touching state; commit() installs it. A BUY whose
// cost exceeds the settled cash projects to std::nullopt.
//
// Thread model:
//   Not synchronized. The owning PortfolioLedger account holds its
//   per-portfolio mutex around every call.
// -----------------------------------------------------------------------------
class CashLedger {
 public:
  explicit CashLedger(double opening_cash = 0.0);

  double cash() const { return cash_; }
  double reserved() const { return reserved_; }
  double available() const;

  // sufficient iff available ≥ estimated_cost.
  CashCheck checkSufficiency(double estimated_cost) const;

  // -------------------------------------------------------------------------
  // reserve(amount)
  // -------------------------------------------------------------------------
  // Holds amount back for a pending BUY. Returns the check that was made;
  // nothing is reserved when it is not sufficient.
  // -------------------------------------------------------------------------
  CashCheck reserve(double amount);

  // Returns a reservation. Clamps at zero so a double release cannot make
  // reserved_ negative.
  void release(double amount);

  // -------------------------------------------------------------------------
  // projectFill(side, quantity, price)
  // -------------------------------------------------------------------------
  // @return The settled balance after the fill: cash − quantity × price for
  //         a BUY, cash + quantity × price for a SELL. std::nullopt when a
  //         BUY would take the balance below zero.
  // -------------------------------------------------------------------------
  std::optional<double> projectFill(domain::Side side, std::int64_t quantity,
                                    double price) const;

  // Installs a balance previously returned by projectFill().
  void commit(double new_cash) { cash_ = new_cash; }

 private:
  double cash_;
  double reserved_{0.0};
};

}  // namespace folio
