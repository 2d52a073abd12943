#pragma once

#include "folio/events/event_types.hpp"
#include "folio/events/holding_update_event.hpp"
#include "folio/events/order_lifecycle_events.hpp"

#include <variant>

namespace folio {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope type for every event in the engine.
// A single variant lets one EventBus carry every event kind without void*
// or inheritance.
//
// Why std::variant:
// - Value semantics: no heap allocation per event, no raw pointers.
// - Type-safe: dispatch with std::get_if or std::visit; the compiler knows
//   the closed set of alternatives.
// -----------------------------------------------------------------------------
using Event = std::variant<
    ExecutionRequestEvent,
    OrderCreatedEvent,
    OrderExecutedEvent,
    OrderFailedEvent,
    HoldingUpdateEvent>;

}  // namespace folio
