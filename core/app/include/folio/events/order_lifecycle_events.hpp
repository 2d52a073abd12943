#pragma once

#include "folio/domain/order.hpp"
#include "folio/domain/transaction.hpp"

#include <cstdint>
#include <string>

namespace folio {

// -----------------------------------------------------------------------------
// Order lifecycle domain events
// -----------------------------------------------------------------------------
//
// @brief  Published by OrderEngine on every order state change so that a
//         presentation layer (IPC telemetry, UI notifications, logging) can
//         react without reaching into the engine.
//
// @details
// Each event carries a full snapshot of the order after the change.
// Rejected submissions produce no event: they never became orders.
//
//   OrderCreatedEvent   — order accepted in Pending.
//   OrderExecutedEvent  — Pending → Executed; carries the Transaction.
//   OrderFailedEvent    — Pending → Failed; order.failure_reason is set.
//
// Thread model:
//   OrderCreatedEvent is published on the submitting thread. The other two
//   are published on whichever thread ran the fill (the FillWorker thread
//   in the server). Subscribers must be thread-safe accordingly.
// -----------------------------------------------------------------------------
struct OrderCreatedEvent {
  domain::Order order;
  std::string symbol;
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

struct OrderExecutedEvent {
  domain::Order order;
  domain::Transaction transaction;
  std::string symbol;
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

struct OrderFailedEvent {
  domain::Order order;
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

}  // namespace folio
