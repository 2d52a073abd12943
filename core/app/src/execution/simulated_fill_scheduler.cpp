#include "folio/execution/simulated_fill_scheduler.hpp"

#include <algorithm>
#include <utility>

namespace folio {

SimulatedFillScheduler::SimulatedFillScheduler(const ITimeProvider& clock,
                                               FillHandler handler)
    : clock_(clock), handler_(std::move(handler)) {}

void SimulatedFillScheduler::schedule(domain::OrderId order_id,
                                      std::int64_t due_ms) {
  std::lock_guard lock(mutex_);
  requests_.push_back(Request{order_id, due_ms, next_sequence_++});
}

std::size_t SimulatedFillScheduler::runDue() {
  std::vector<Request> due;
  {
    std::lock_guard lock(mutex_);
    const std::int64_t now = clock_.now_ms();
    auto split = std::stable_partition(
        requests_.begin(), requests_.end(),
        [now](const Request& r) { return r.due_ms > now; });
    due.assign(split, requests_.end());
    requests_.erase(split, requests_.end());
  }

  std::sort(due.begin(), due.end(), [](const Request& a, const Request& b) {
    if (a.due_ms != b.due_ms) {
      return a.due_ms < b.due_ms;
    }
    return a.sequence < b.sequence;
  });

  for (const auto& request : due) {
    handler_(request.order_id);
  }
  return due.size();
}

std::size_t SimulatedFillScheduler::pendingCount() const {
  std::lock_guard lock(mutex_);
  return requests_.size();
}

}  // namespace folio
