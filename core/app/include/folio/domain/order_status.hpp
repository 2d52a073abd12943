#pragma once

namespace folio {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus — order lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Every state a persisted order can occupy.
//
// @details
// The lifecycle is deliberately short:
//
//   Pending ──────> Executed
//      │
//      └──────────> Failed
//
// Terminal states: Executed, Failed. Once an order reaches a terminal state
// no further transition is permitted and no field of the order may change.
// OrderStateMachine::transitionStatus() is the single place that encodes the
// graph; OrderStore refuses any mutation it rejects.
//
// A submission that fails validation never becomes an order at all, so
// there is no "Rejected" state here. Rejections are reported to the caller
// through SubmissionResult instead.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,   // Accepted and waiting for its fill
  Executed,  // Terminal: filled, cash and holdings mutated
  Failed,    // Terminal: accepted but could not be filled
};

const char* orderStatusToString(OrderStatus status);

}  // namespace domain
}  // namespace folio
