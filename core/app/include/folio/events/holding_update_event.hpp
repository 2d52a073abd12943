#pragma once

#include "folio/domain/holding.hpp"

#include <cstdint>
#include <string>

namespace folio {

// -----------------------------------------------------------------------------
// HoldingUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of a holding and the portfolio's cash right after a fill
//         was committed.
//
// @details
// removed is true when the fill took the quantity to zero and the holding
// was deleted; holding then carries the last persisted values with
// quantity set to 0 so subscribers know which position disappeared.
//
// Thread model:
//   Published by OrderEngine on the fill thread, after the ledger lock has
//   been released. Plain value type, safe to copy across threads.
// -----------------------------------------------------------------------------
struct HoldingUpdateEvent {
  domain::Holding holding;
  bool removed{false};
  double cash_after{0.0};
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

}  // namespace folio
