#pragma once

#include "folio/domain/order.hpp"

#include <cstdint>
#include <functional>

namespace folio {

// -----------------------------------------------------------------------------
// IFillScheduler — abstract interface for deferred order execution
// -----------------------------------------------------------------------------
//
// @brief  Receives "execute order X no earlier than T" requests from
//         OrderEngine and later invokes the fill handler it was built with.
//
// @details
// OrderEngine accepts orders synchronously and never fills them inline.
// Where and when the fill runs is the scheduler's business:
//   * FillWorker              a single-consumer worker thread that waits
//                             for the due time against the injected clock.
//   * SimulatedFillScheduler  holds requests until the test advances a
//                             SimulationTimeProvider and calls runDue().
//
// Both invoke the handler for one order at a time, so two fills never
// overlap. A handler may be invoked more than once for the same order
// (a redelivered request); OrderEngine::executeOrder() turns the repeat
// into a no-op.
//
// Ownership:
//   WealthEngine owns the scheduler via std::unique_ptr and passes a
//   reference to OrderEngine.
// -----------------------------------------------------------------------------
class IFillScheduler {
 public:
  using FillHandler = std::function<void(domain::OrderId)>;

  virtual ~IFillScheduler() = default;

  // -------------------------------------------------------------------------
  // schedule(order_id, due_ms)
  // -------------------------------------------------------------------------
  // Queues the order for execution at or after due_ms (epoch ms).
  // Thread-safety: Safe from any thread.
  // -------------------------------------------------------------------------
  virtual void schedule(domain::OrderId order_id, std::int64_t due_ms) = 0;
};

}  // namespace folio
