#pragma once

#include "folio/analytics/allocation_calculator.hpp"
#include "folio/analytics/drift_calculator.hpp"
#include "folio/analytics/portfolio_valuator.hpp"
#include "folio/analytics/rebalance_advisor.hpp"
#include "folio/domain/audit_event.hpp"
#include "folio/domain/holding.hpp"
#include "folio/domain/order.hpp"
#include "folio/domain/transaction.hpp"
#include "folio/events/event.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace folio {

// -----------------------------------------------------------------------------
// CommandError
// -----------------------------------------------------------------------------
// A command request that is well-formed JSON but carries an invalid value
// (unknown side, missing portfolio_id, ...). Caught at the command boundary
// together with nlohmann::json::exception and turned into an error reply.
// -----------------------------------------------------------------------------
class CommandError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// JSON codec
// -----------------------------------------------------------------------------
// Wire representations shared by the IPC command replies and the PUB
// telemetry stream. Enums are written as their upper-case names; optional
// fields are omitted when unset; timestamps are epoch milliseconds.
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::Order& order);
nlohmann::json toJson(const domain::Transaction& transaction);
nlohmann::json toJson(const domain::Holding& holding);
nlohmann::json toJson(const domain::AuditEvent& event);
nlohmann::json toJson(const AllocationEntry& entry);
nlohmann::json toJson(const DriftResult& drift);
nlohmann::json toJson(const Recommendation& recommendation);
nlohmann::json toJson(const PortfolioValuation& valuation);

// -----------------------------------------------------------------------------
// orderRequestFromJson(json)
// -----------------------------------------------------------------------------
// Reads the SUBMIT_ORDER fields: portfolio_id, instrument_id, side,
// quantity (required); order_type (default MARKET), limit_price,
// requested_by, idempotency_key (optional).
//
// @throws CommandError for a missing field or an unknown enum name;
//         nlohmann::json::exception for a wrongly typed field.
// -----------------------------------------------------------------------------
domain::OrderRequest orderRequestFromJson(const nlohmann::json& request);

// -----------------------------------------------------------------------------
// formatTelemetry(event)
// -----------------------------------------------------------------------------
// One telemetry message per lifecycle or holding event, tagged by "type":
// order_created, order_executed, order_failed, holding_update.
// std::nullopt for event types that are not broadcast.
// -----------------------------------------------------------------------------
std::optional<nlohmann::json> formatTelemetry(const Event& event);

}  // namespace folio
