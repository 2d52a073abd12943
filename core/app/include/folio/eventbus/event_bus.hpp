#pragma once

#include "folio/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace folio {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for domain events. The order
// engine publishes lifecycle and holding events; presentation concerns
// (IPC telemetry, logging, tests) subscribe. The engine never calls a
// notification sink directly.
//
// Thread model: Thread-safe for concurrent subscribe, unsubscribe, and
// publish from any thread. Callbacks run synchronously on the thread that
// calls publish(); there is no dispatcher thread.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  // Receives every event; use std::get_if / std::visit to pick types.
  using GenericCallback = std::function<void(const Event&)>;

  // Opaque id returned by subscribe(); pass to unsubscribe() to remove.
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked for every published event.
  // Thread-safety: Safe from any thread.
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked only when the published event holds an
  // EventType (e.g. OrderExecutedEvent).
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // Removes the subscription. A publish() already in progress may still
  // deliver the current event to it; later publishes will not. Unknown ids
  // are ignored.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Delivers the event to every current subscriber before returning. The
  // subscriber list is copied under the lock and the callbacks run without
  // it, so a callback may publish or unsubscribe without deadlocking.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  // Number of live subscriptions. Snapshot only.
  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

// -----------------------------------------------------------------------------
// Template implementation: typed subscribe
// -----------------------------------------------------------------------------
// Wraps the typed callback in a generic one that checks the variant with
// std::get_if and ignores every other alternative.
// -----------------------------------------------------------------------------
template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace folio
