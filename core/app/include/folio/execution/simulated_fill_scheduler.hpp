#pragma once

#include "folio/execution/i_fill_scheduler.hpp"
#include "folio/time/i_time_provider.hpp"

#include <cstdint>
#include <mutex>
#include <vector>

namespace folio {

// -----------------------------------------------------------------------------
// SimulatedFillScheduler — deterministic fill scheduling
// -----------------------------------------------------------------------------
//
// @brief  IFillScheduler that runs nothing on its own. Requests wait until
//         runDue() is called; runDue() executes every request whose due
//         time is ≤ clock.now_ms(), earliest due first, FIFO among equal
//         due times, on the calling thread.
//
// @details
// Used by tests and by any harness that drives time itself:
//
//   clock.advance_by(limits.fill_delay_ms);
//   scheduler.runDue();
//
// schedule() may be called again for an order that is already queued; the
// request is simply queued twice. This is how tests exercise duplicate
// execution triggers.
//
// Thread model: schedule() and runDue() are mutex-protected; the handler is
// invoked without the lock held so it may schedule further work.
// -----------------------------------------------------------------------------
class SimulatedFillScheduler final : public IFillScheduler {
 public:
  SimulatedFillScheduler(const ITimeProvider& clock, FillHandler handler);

  void schedule(domain::OrderId order_id, std::int64_t due_ms) override;

  // Returns the number of requests executed.
  std::size_t runDue();

  std::size_t pendingCount() const;

 private:
  struct Request {
    domain::OrderId order_id{};
    std::int64_t due_ms{0};
    std::uint64_t sequence{0};
  };

  const ITimeProvider& clock_;
  FillHandler handler_;

  mutable std::mutex mutex_;
  std::vector<Request> requests_;
  std::uint64_t next_sequence_{1};
};

}  // namespace folio
