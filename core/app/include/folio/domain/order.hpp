#pragma once

#include "folio/domain/order_status.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace folio {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Unique identifier for an order, produced by IdGenerator. 0 is
// reserved as "unset".
// -----------------------------------------------------------------------------
using OrderId = std::uint64_t;

enum class Side {
  Buy,
  Sell,
};

enum class OrderType {
  Market,  // Fills at the instrument's current price
  Limit,   // Fills at limit_price
};

const char* sideToString(Side side);
const char* orderTypeToString(OrderType type);
std::optional<Side> parseSide(const std::string& name);
std::optional<OrderType> parseOrderType(const std::string& name);

// -----------------------------------------------------------------------------
// OrderRequest
// -----------------------------------------------------------------------------
// Responsibility: What a caller asks for when submitting an order. Nothing
// in here is trusted until OrderEngine::submitOrder() has validated it.
//
// limit_price is required iff order_type is Limit; it is ignored for Market
// orders. idempotency_key is optional: when set, resubmitting the same key
// returns the order that already carries it instead of creating another.
// -----------------------------------------------------------------------------
struct OrderRequest {
  std::string portfolio_id;
  std::string instrument_id;
  Side side{Side::Buy};
  OrderType order_type{OrderType::Market};
  std::int64_t quantity{0};
  std::optional<double> limit_price;
  std::string requested_by{"system"};
  std::optional<std::string> idempotency_key;
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
//
// @brief  An accepted order and its execution outcome.
//
// @details
// Created in Pending by OrderEngine::submitOrder() once every pre-trade
// check passes. It transitions exactly once, to Executed (executed_at_ms and
// executed_price set) or Failed (failure_reason set). After that it is
// immutable; OrderStore enforces this.
//
// Copies handed out by OrderStore and carried in events are snapshots.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};
  std::string portfolio_id;
  std::string instrument_id;
  Side side{Side::Buy};
  OrderType order_type{OrderType::Market};
  std::int64_t quantity{0};
  std::optional<double> limit_price;
  OrderStatus status{OrderStatus::Pending};
  std::string created_by;
  std::int64_t created_at_ms{0};
  std::optional<std::int64_t> executed_at_ms;
  std::optional<double> executed_price;
  std::optional<std::string> failure_reason;
  std::string idempotency_key;
  double reserved_cash{0.0};  // Estimated cost held back for a pending BUY
};

}  // namespace domain
}  // namespace folio
