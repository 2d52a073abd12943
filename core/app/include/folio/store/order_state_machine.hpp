#pragma once

#include "folio/domain/order_status.hpp"

namespace folio {

// -----------------------------------------------------------------------------
// OrderStateMachine — legal order status transitions
// -----------------------------------------------------------------------------
//
// @brief  The transition graph every status change is checked against.
//
// @details
// Legal transitions:
//   Pending  → Executed, Failed
//   Executed → (none, terminal)
//   Failed   → (none, terminal)
//
// Self-transitions are illegal, including Pending → Pending. OrderStore
// calls transitionStatus() before every mutation and refuses (and logs)
// anything it rejects; nothing throws.
//
// Thread model: Pure functions, safe from any context.
// -----------------------------------------------------------------------------
class OrderStateMachine {
 public:
  static bool transitionStatus(domain::OrderStatus current,
                               domain::OrderStatus next);

  // True for Executed and Failed.
  static bool isTerminal(domain::OrderStatus status);
};

}  // namespace folio
