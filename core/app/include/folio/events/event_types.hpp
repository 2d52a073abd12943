#pragma once

#include "folio/domain/order.hpp"

#include <cstdint>

namespace folio {

// -----------------------------------------------------------------------------
// ExecutionRequestEvent
// -----------------------------------------------------------------------------
// Responsibility: A scheduled fill. OrderEngine hands one to the fill
// scheduler when an order is accepted; the scheduler's worker executes the
// order once due_ms has been reached.
// Why an event: FillWorker is an event loop like every other thread in the
// engine. The request travels through its queue, so fills are processed one
// at a time, in submission order, on a single consumer thread.
// -----------------------------------------------------------------------------
struct ExecutionRequestEvent {
  domain::OrderId order_id{};
  std::int64_t due_ms{0};        // Epoch ms at which the fill may run
  std::uint64_t sequence_id{0};  // Monotonic per scheduler, for FIFO ties
};

}  // namespace folio
