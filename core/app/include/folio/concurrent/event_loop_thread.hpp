#pragma once

#include "folio/concurrent/thread_safe_queue.hpp"
#include "folio/eventbus/event_bus.hpp"
#include "folio/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace folio {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue<Event>
// and publishes each event on its own EventBus from that thread. Any thread
// may push(); subscribers to the bus only ever run on the loop thread, so
// whatever they do is serialized.
//
// The FillWorker is built on one of these: every scheduled fill in the
// engine is executed by the single subscriber of a single loop, which is
// what guarantees that two fills never interleave their ledger mutations.
//
// Thread model: start(), stop(), push() and eventBus() are safe from any
// thread. Subscriber callbacks run on the loop thread only.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;

  // Joins the worker; RAII ownership of the thread.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Starts the worker. Idempotent.
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Clears running_, wakes the worker and joins it. Events still queued are
  // left in the queue and are not published. Idempotent; start() may be
  // called again afterwards.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueue an event for publication on the loop thread.
  void push(Event event) { queue_.push(std::move(event)); }

  // Number of events waiting to be published.
  std::size_t pending() const { return queue_.size(); }

  bool running() const { return running_.load(); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

 private:
  // Worker entry point: try_pop() and publish, otherwise wait briefly on
  // stop_cv_ and re-check running_.
  void run();

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace folio
