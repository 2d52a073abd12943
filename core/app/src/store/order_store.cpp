#include "folio/store/order_store.hpp"
#include "folio/store/order_state_machine.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>

namespace folio {

bool OrderStore::insert(const domain::Order& order) {
  if (order.status != domain::OrderStatus::Pending) {
    std::cerr << "[OrderStore] WARNING: refusing to insert order_id="
              << order.id << " in status "
              << domain::orderStatusToString(order.status) << "\n";
    return false;
  }

  std::unique_lock lock(mutex_);
  if (orders_.count(order.id) != 0) {
    return false;
  }
  if (!order.idempotency_key.empty() &&
      by_key_.count(order.idempotency_key) != 0) {
    return false;
  }

  orders_.emplace(order.id, order);
  if (!order.idempotency_key.empty()) {
    by_key_.emplace(order.idempotency_key, order.id);
  }
  return true;
}

std::optional<domain::Order> OrderStore::find(domain::OrderId id) const {
  std::shared_lock lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::Order> OrderStore::findByIdempotencyKey(
    const std::string& key) const {
  std::shared_lock lock(mutex_);
  auto key_it = by_key_.find(key);
  if (key_it == by_key_.end()) {
    return std::nullopt;
  }
  auto it = orders_.find(key_it->second);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

domain::Order* OrderStore::transitionLocked(domain::OrderId id,
                                            domain::OrderStatus next) {
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    std::cerr << "[OrderStore] WARNING: transition for unknown order_id="
              << id << ". Skipping.\n";
    return nullptr;
  }

  domain::Order& order = it->second;
  if (!OrderStateMachine::transitionStatus(order.status, next)) {
    std::cerr << "[OrderStore] WARNING: illegal transition for order_id="
              << id << " from " << domain::orderStatusToString(order.status)
              << " to " << domain::orderStatusToString(next)
              << ". Skipping.\n";
    return nullptr;
  }

  order.status = next;
  return &order;
}

std::optional<domain::Order> OrderStore::markExecuted(
    domain::OrderId id, std::int64_t executed_at_ms, double executed_price) {
  std::unique_lock lock(mutex_);
  domain::Order* order = transitionLocked(id, domain::OrderStatus::Executed);
  if (order == nullptr) {
    return std::nullopt;
  }
  order->executed_at_ms = executed_at_ms;
  order->executed_price = executed_price;
  return *order;
}

std::optional<domain::Order> OrderStore::markFailed(domain::OrderId id,
                                                    const std::string& reason) {
  std::unique_lock lock(mutex_);
  domain::Order* order = transitionLocked(id, domain::OrderStatus::Failed);
  if (order == nullptr) {
    return std::nullopt;
  }
  order->failure_reason = reason;
  return *order;
}

std::vector<domain::Order> OrderStore::ordersForPortfolio(
    const std::string& portfolio_id) const {
  std::vector<domain::Order> result;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, order] : orders_) {
      if (order.portfolio_id == portfolio_id) {
        result.push_back(order);
      }
    }
  }

  std::sort(result.begin(), result.end(),
            [](const domain::Order& a, const domain::Order& b) {
              if (a.created_at_ms != b.created_at_ms) {
                return a.created_at_ms > b.created_at_ms;
              }
              return a.id > b.id;
            });
  return result;
}

std::vector<domain::OrderId> OrderStore::pendingOrderIds() const {
  std::vector<domain::OrderId> ids;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, order] : orders_) {
      if (order.status == domain::OrderStatus::Pending) {
        ids.push_back(id);
      }
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::size_t OrderStore::size() const {
  std::shared_lock lock(mutex_);
  return orders_.size();
}

}  // namespace folio
