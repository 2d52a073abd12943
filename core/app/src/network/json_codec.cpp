#include "folio/network/json_codec.hpp"

namespace folio {

nlohmann::json toJson(const domain::Order& order) {
  nlohmann::json j;
  j["id"] = order.id;
  j["portfolio_id"] = order.portfolio_id;
  j["instrument_id"] = order.instrument_id;
  j["side"] = domain::sideToString(order.side);
  j["order_type"] = domain::orderTypeToString(order.order_type);
  j["quantity"] = order.quantity;
  if (order.limit_price) {
    j["limit_price"] = *order.limit_price;
  }
  j["status"] = domain::orderStatusToString(order.status);
  j["created_by"] = order.created_by;
  j["created_at_ms"] = order.created_at_ms;
  if (order.executed_at_ms) {
    j["executed_at_ms"] = *order.executed_at_ms;
  }
  if (order.executed_price) {
    j["executed_price"] = *order.executed_price;
  }
  if (order.failure_reason) {
    j["failure_reason"] = *order.failure_reason;
  }
  j["idempotency_key"] = order.idempotency_key;
  return j;
}

nlohmann::json toJson(const domain::Transaction& transaction) {
  nlohmann::json j;
  j["id"] = transaction.id;
  j["portfolio_id"] = transaction.portfolio_id;
  j["instrument_id"] = transaction.instrument_id;
  j["type"] = domain::transactionTypeToString(transaction.type);
  j["quantity"] = transaction.quantity;
  j["price"] = transaction.price;
  j["amount"] = transaction.amount;
  if (transaction.realized_gain) {
    j["realized_gain"] = *transaction.realized_gain;
  }
  j["timestamp_ms"] = transaction.timestamp_ms;
  if (transaction.order_id) {
    j["order_id"] = *transaction.order_id;
  }
  return j;
}

nlohmann::json toJson(const domain::Holding& holding) {
  nlohmann::json j;
  j["portfolio_id"] = holding.portfolio_id;
  j["instrument_id"] = holding.instrument_id;
  j["quantity"] = holding.quantity;
  j["average_cost"] = holding.average_cost;
  j["last_updated_ms"] = holding.last_updated_ms;
  return j;
}

nlohmann::json toJson(const domain::AuditEvent& event) {
  nlohmann::json j;
  j["id"] = event.id;
  j["type"] = domain::auditEventTypeToString(event.type);
  j["actor"] = event.actor;
  j["client_id"] = event.client_id;
  j["timestamp_ms"] = event.timestamp_ms;
  j["details"] = event.details;
  return j;
}

nlohmann::json toJson(const AllocationEntry& entry) {
  nlohmann::json j;
  j["asset_class"] = domain::assetClassToString(entry.asset_class);
  j["value"] = entry.value;
  j["percentage"] = entry.percentage;
  return j;
}

nlohmann::json toJson(const DriftResult& drift) {
  nlohmann::json j;
  j["model_id"] = drift.model_id;
  j["model_name"] = drift.model_name;
  j["drift_percentage"] = drift.drift_percentage;
  return j;
}

nlohmann::json toJson(const Recommendation& recommendation) {
  nlohmann::json j;
  j["type"] = recommendationTypeToString(recommendation.type);
  j["priority"] = recommendationPriorityToString(recommendation.priority);
  j["title"] = recommendation.title;
  j["description"] = recommendation.description;
  j["metric"] = recommendation.metric;
  if (recommendation.instrument_id) {
    j["instrument_id"] = *recommendation.instrument_id;
  }
  return j;
}

nlohmann::json toJson(const PortfolioValuation& valuation) {
  nlohmann::json j;
  j["id"] = valuation.portfolio.id;
  j["client_id"] = valuation.portfolio.client_id;
  j["base_currency"] = valuation.portfolio.base_currency;
  j["cash"] = valuation.portfolio.cash;
  j["reserved_cash"] = valuation.reserved_cash;
  j["holdings_value"] = valuation.holdings_value;
  j["total_value"] = valuation.total_value;

  nlohmann::json holdings = nlohmann::json::array();
  for (const auto& entry : valuation.holdings) {
    nlohmann::json h = toJson(entry.holding);
    h["symbol"] = entry.symbol;
    h["asset_class"] = domain::assetClassToString(entry.asset_class);
    h["current_price"] = entry.current_price;
    h["market_value"] = entry.market_value;
    h["unrealized_gain"] = entry.unrealized_gain;
    h["weight_pct"] = entry.weight_pct;
    holdings.push_back(h);
  }
  j["holdings"] = holdings;

  nlohmann::json unpriced = nlohmann::json::array();
  for (const auto& holding : valuation.unpriced) {
    unpriced.push_back(toJson(holding));
  }
  j["unpriced_holdings"] = unpriced;
  return j;
}

domain::OrderRequest orderRequestFromJson(const nlohmann::json& request) {
  for (const char* key : {"portfolio_id", "instrument_id", "side", "quantity"}) {
    if (!request.contains(key)) {
      throw CommandError(std::string("missing field '") + key + "'");
    }
  }

  domain::OrderRequest order;
  order.portfolio_id = request.at("portfolio_id").get<std::string>();
  order.instrument_id = request.at("instrument_id").get<std::string>();
  order.quantity = request.at("quantity").get<std::int64_t>();

  const std::string side = request.at("side").get<std::string>();
  auto parsed_side = domain::parseSide(side);
  if (!parsed_side) {
    throw CommandError("unknown side '" + side + "'");
  }
  order.side = *parsed_side;

  if (request.contains("order_type")) {
    const std::string type = request.at("order_type").get<std::string>();
    auto parsed_type = domain::parseOrderType(type);
    if (!parsed_type) {
      throw CommandError("unknown order_type '" + type + "'");
    }
    order.order_type = *parsed_type;
  }

  if (request.contains("limit_price") && !request.at("limit_price").is_null()) {
    order.limit_price = request.at("limit_price").get<double>();
  }
  if (request.contains("requested_by")) {
    order.requested_by = request.at("requested_by").get<std::string>();
  }
  if (request.contains("idempotency_key")) {
    order.idempotency_key = request.at("idempotency_key").get<std::string>();
  }
  return order;
}

std::optional<nlohmann::json> formatTelemetry(const Event& event) {
  if (const auto* e = std::get_if<OrderCreatedEvent>(&event)) {
    nlohmann::json j;
    j["type"] = "order_created";
    j["order"] = toJson(e->order);
    j["symbol"] = e->symbol;
    j["timestamp_ms"] = e->timestamp_ms;
    j["sequence_id"] = e->sequence_id;
    return j;
  }
  if (const auto* e = std::get_if<OrderExecutedEvent>(&event)) {
    nlohmann::json j;
    j["type"] = "order_executed";
    j["order"] = toJson(e->order);
    j["transaction"] = toJson(e->transaction);
    j["symbol"] = e->symbol;
    j["timestamp_ms"] = e->timestamp_ms;
    j["sequence_id"] = e->sequence_id;
    return j;
  }
  if (const auto* e = std::get_if<OrderFailedEvent>(&event)) {
    nlohmann::json j;
    j["type"] = "order_failed";
    j["order"] = toJson(e->order);
    j["reason"] = e->order.failure_reason.value_or("");
    j["timestamp_ms"] = e->timestamp_ms;
    j["sequence_id"] = e->sequence_id;
    return j;
  }
  if (const auto* e = std::get_if<HoldingUpdateEvent>(&event)) {
    nlohmann::json j;
    j["type"] = "holding_update";
    j["holding"] = toJson(e->holding);
    j["removed"] = e->removed;
    j["cash_after"] = e->cash_after;
    j["timestamp_ms"] = e->timestamp_ms;
    j["sequence_id"] = e->sequence_id;
    return j;
  }
  return std::nullopt;
}

}  // namespace folio
