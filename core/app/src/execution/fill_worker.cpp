#include "folio/execution/fill_worker.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <utility>

namespace folio {

namespace {

constexpr std::int64_t kMaxWaitSliceMs = 50;

}  // namespace

FillWorker::FillWorker(const ITimeProvider& clock, FillHandler handler)
    : clock_(clock), handler_(std::move(handler)) {
  request_sub_id_ = loop_.eventBus().subscribe<ExecutionRequestEvent>(
      [this](const ExecutionRequestEvent& e) { onRequest(e); });
}

FillWorker::~FillWorker() {
  stop();
  loop_.eventBus().unsubscribe(request_sub_id_);
}

void FillWorker::start() {
  if (loop_.running()) {
    return;
  }
  stopping_.store(false);
  loop_.start();
  std::cout << "[FillWorker] Started.\n";
}

void FillWorker::stop() {
  if (!loop_.running()) {
    return;
  }

  {
    std::lock_guard lock(wait_mutex_);
    stopping_.store(true);
  }
  wait_cv_.notify_all();
  loop_.stop();

  const std::size_t dropped = loop_.pending();
  if (dropped > 0) {
    std::cerr << "[FillWorker] Stopped with " << dropped
              << " fill request(s) queued; orders remain PENDING until "
                 "restart.\n";
  } else {
    std::cout << "[FillWorker] Stopped.\n";
  }
}

void FillWorker::schedule(domain::OrderId order_id, std::int64_t due_ms) {
  ExecutionRequestEvent request;
  request.order_id = order_id;
  request.due_ms = due_ms;
  request.sequence_id = next_sequence_.fetch_add(1);
  loop_.push(request);
}

bool FillWorker::waitUntilDue(std::int64_t due_ms) {
  std::unique_lock lock(wait_mutex_);
  while (!stopping_.load()) {
    const std::int64_t remaining = due_ms - clock_.now_ms();
    if (remaining <= 0) {
      return true;
    }
    const auto slice =
        std::chrono::milliseconds(std::min(remaining, kMaxWaitSliceMs));
    wait_cv_.wait_for(lock, slice, [this] { return stopping_.load(); });
  }
  return false;
}

void FillWorker::onRequest(const ExecutionRequestEvent& request) {
  if (!waitUntilDue(request.due_ms)) {
    std::cerr << "[FillWorker] Shutdown before order_id=" << request.order_id
              << " was due; requeued.\n";
    loop_.push(request);
    return;
  }
  handler_(request.order_id);
}

}  // namespace folio
