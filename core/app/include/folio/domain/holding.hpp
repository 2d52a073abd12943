#pragma once

#include <cstdint>
#include <string>

namespace folio {
namespace domain {

// -----------------------------------------------------------------------------
// Holding — one instrument position inside one portfolio
// -----------------------------------------------------------------------------
//
// @brief  Quantity owned and its quantity-weighted average cost.
//
// @details
// Unique per (portfolio_id, instrument_id). quantity is always > 0 for a
// stored holding: a fill that takes it to zero or below deletes the record
// instead of persisting it at zero. average_cost is > 0 and changes only on
// BUY fills; SELL fills leave it untouched.
//
// Thread model:
//   The authoritative copy lives inside HoldingsBook and is mutated only
//   under the owning portfolio's ledger lock. Everything else sees copies.
// -----------------------------------------------------------------------------
struct Holding {
  std::string portfolio_id;
  std::string instrument_id;
  std::int64_t quantity{0};
  double average_cost{0.0};
  std::int64_t last_updated_ms{0};
};

}  // namespace domain
}  // namespace folio
