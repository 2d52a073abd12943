#pragma once

#include "folio/concurrent/event_loop_thread.hpp"
#include "folio/events/event_types.hpp"
#include "folio/execution/i_fill_scheduler.hpp"
#include "folio/time/i_time_provider.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace folio {

// -----------------------------------------------------------------------------
// FillWorker — single-consumer fill thread
// -----------------------------------------------------------------------------
//
// @brief  IFillScheduler backed by an EventLoopThread. Each schedule() call
//         becomes an ExecutionRequestEvent on the loop's queue; the loop's
//         only subscriber waits until the request is due and then calls
//         the fill handler.
//
// @details
// Because there is one consumer, fills run strictly one after another in
// scheduling order. A request whose due time has not arrived blocks the
// requests queued behind it, which is what we want: with a constant fill
// delay, scheduling order and due order coincide.
//
// The wait is re-evaluated against the clock every kMaxWaitSlice, so a
// SimulationTimeProvider moved forward by a test is noticed as well as the
// system clock.
//
// Shutdown:
//   stop() interrupts a wait in progress and joins the loop. The
//   interrupted request goes back on the queue with the ones not yet
//   picked up, so a later start() executes them; until then their orders
//   stay Pending. Queued work does not outlive the FillWorker.
//
// Thread model:
//   schedule(), start(), stop() from any thread. The handler runs on the
//   worker thread only.
// -----------------------------------------------------------------------------
class FillWorker final : public IFillScheduler {
 public:
  FillWorker(const ITimeProvider& clock, FillHandler handler);
  ~FillWorker() override;

  FillWorker(const FillWorker&) = delete;
  FillWorker& operator=(const FillWorker&) = delete;

  void start();
  void stop();

  void schedule(domain::OrderId order_id, std::int64_t due_ms) override;

  bool running() const { return loop_.running(); }

  // Requests queued but not yet picked up by the worker.
  std::size_t pending() const { return loop_.pending(); }

 private:
  void onRequest(const ExecutionRequestEvent& request);

  // Blocks until clock_ reaches due_ms. Returns false if stop() interrupted.
  bool waitUntilDue(std::int64_t due_ms);

  const ITimeProvider& clock_;
  FillHandler handler_;
  EventLoopThread loop_;
  EventBus::SubscriptionId request_sub_id_{0};

  std::atomic<std::uint64_t> next_sequence_{1};
  std::atomic<bool> stopping_{false};
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;
};

}  // namespace folio
