#pragma once

#include "folio/domain/holding.hpp"
#include "folio/domain/order.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace folio {

// -----------------------------------------------------------------------------
// HoldingChange
// -----------------------------------------------------------------------------
// A fill's effect on one holding, computed by HoldingsBook::previewFill()
// and installed by commit(). When removed is true, holding carries the
// quantity left after the sell (≤ 0) and is erased rather than stored.
// realized_gain is set for sells only.
// -----------------------------------------------------------------------------
struct HoldingChange {
  domain::Holding holding;
  bool removed{false};
  std::optional<double> realized_gain;
};

// -----------------------------------------------------------------------------
// HoldingsBook — instrument positions of one portfolio
// -----------------------------------------------------------------------------
//
// @brief  Map of instrument id → Holding with average-cost accounting and
//         per-instrument reservations for pending SELL orders.
//
// @details
// Fill rules:
//
//   BUY, no holding:   quantity = q, average_cost = price
//   BUY, holding:      new_q   = old_q + q
//                      new_avg = (old_q × old_avg + q × price) / new_q
//   SELL, holding:     new_q = old_q − q; erased when new_q ≤ 0;
//                      average_cost unchanged;
//                      realized_gain = q × (price − average_cost)
//   SELL, no holding
//   or q > held:       previewFill() returns std::nullopt
//
// previewFill() also returns std::nullopt for q ≤ 0, price ≤ 0, or a BUY
// whose new_q would not fit in int64, so every stored holding keeps
// quantity > 0 and average_cost > 0.
//
// The average is computed from the two products before dividing, in that
// order, so repeated buys do not accumulate rounding from intermediate
// quotients.
//
// Reservations: a pending SELL reserves its quantity so a second SELL on
// the same instrument cannot be accepted against units already promised.
// availableQuantity() = held − reserved.
//
// Thread model:
//   Not synchronized; guarded by the owning PortfolioLedger account mutex.
// -----------------------------------------------------------------------------
class HoldingsBook {
 public:
  explicit HoldingsBook(std::string portfolio_id);

  // -------------------------------------------------------------------------
  // hydrate(holding)
  // -------------------------------------------------------------------------
  // Loads an existing position (seed data or a previous session). Returns
  // false when quantity ≤ 0, average_cost ≤ 0, or the holding belongs to
  // another portfolio. Replaces any holding already stored for the
  // instrument.
  // -------------------------------------------------------------------------
  bool hydrate(const domain::Holding& holding);

  std::optional<domain::Holding> find(const std::string& instrument_id) const;

  // All holdings, ordered by instrument id.
  std::vector<domain::Holding> all() const;

  std::int64_t heldQuantity(const std::string& instrument_id) const;
  std::int64_t reservedQuantity(const std::string& instrument_id) const;
  std::int64_t availableQuantity(const std::string& instrument_id) const;

  // Reserves quantity for a pending SELL. Returns false (nothing reserved)
  // if fewer than quantity units are available.
  bool reserve(const std::string& instrument_id, std::int64_t quantity);
  void release(const std::string& instrument_id, std::int64_t quantity);

  std::optional<HoldingChange> previewFill(domain::Side side,
                                           const std::string& instrument_id,
                                           std::int64_t quantity, double price,
                                           std::int64_t now_ms) const;

  void commit(const HoldingChange& change);

  std::size_t size() const { return holdings_.size(); }

 private:
  std::string portfolio_id_;
  std::map<std::string, domain::Holding> holdings_;
  std::map<std::string, std::int64_t> reserved_;
};

}  // namespace folio
