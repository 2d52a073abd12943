#pragma once

#include "folio/domain/order.hpp"

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace folio {

// -----------------------------------------------------------------------------
// OrderStore — every accepted order and its status
// -----------------------------------------------------------------------------
//
// @brief  Keyed by OrderId with a secondary unique index on
//         idempotency_key. Status changes go through markExecuted() and
//         markFailed(), both guarded by OrderStateMachine.
//
// @details
// Rejected submissions are never inserted, so everything in here is either
// Pending or a terminal state reached after acceptance. A terminal order is
// never modified again: a second markExecuted()/markFailed() on it returns
// std::nullopt and logs a warning.
//
// Thread model:
//   std::shared_mutex. Submission inserts, the fill worker transitions,
//   and the IPC thread reads history concurrently.
// -----------------------------------------------------------------------------
class OrderStore {
 public:
  OrderStore() = default;

  OrderStore(const OrderStore&) = delete;
  OrderStore& operator=(const OrderStore&) = delete;

  // -------------------------------------------------------------------------
  // insert(order)
  // -------------------------------------------------------------------------
  // Stores a new order. Returns false (nothing stored) when the id or the
  // idempotency key is already taken, or the order is not Pending.
  // -------------------------------------------------------------------------
  bool insert(const domain::Order& order);

  std::optional<domain::Order> find(domain::OrderId id) const;
  std::optional<domain::Order> findByIdempotencyKey(
      const std::string& key) const;

  // -------------------------------------------------------------------------
  // markExecuted(id, executed_at_ms, executed_price)
  // markFailed(id, reason)
  // -------------------------------------------------------------------------
  // @return The order after the transition, or std::nullopt when the order
  //         is unknown or the transition is illegal (it has already left
  //         Pending).
  // -------------------------------------------------------------------------
  std::optional<domain::Order> markExecuted(domain::OrderId id,
                                            std::int64_t executed_at_ms,
                                            double executed_price);
  std::optional<domain::Order> markFailed(domain::OrderId id,
                                          const std::string& reason);

  // Orders of one portfolio, newest created_at first, ties by id descending.
  std::vector<domain::Order> ordersForPortfolio(
      const std::string& portfolio_id) const;

  // Ids of orders still Pending, ascending.
  std::vector<domain::OrderId> pendingOrderIds() const;

  std::size_t size() const;

 private:
  // Caller holds mutex_ exclusively.
  domain::Order* transitionLocked(domain::OrderId id,
                                  domain::OrderStatus next);

  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::OrderId, domain::Order> orders_;
  std::unordered_map<std::string, domain::OrderId> by_key_;
};

}  // namespace folio
