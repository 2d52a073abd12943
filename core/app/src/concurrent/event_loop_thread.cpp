#include "folio/concurrent/event_loop_thread.hpp"

#include <chrono>

namespace folio {

namespace {

// How long the worker sleeps on an empty queue before re-checking
// running_. stop() notifies, so this only bounds the idle poll.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::~EventLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }

  // Must be visible before the worker's first check of running_.
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }

  running_.store(false);
  stop_cv_.notify_all();

  // No lock is held across join(); the worker may need stop_mutex_ to
  // leave its wait.
  thread_.join();
}

// -----------------------------------------------------------------------------
// run() — worker loop
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.try_pop();

    if (event) {
      bus_.publish(*event);
      continue;
    }

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load(); });
  }
}

}  // namespace folio
