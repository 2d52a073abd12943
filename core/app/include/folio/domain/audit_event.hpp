#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace folio {
namespace domain {

enum class AuditEventType {
  OrderCreated,
  OrderExecuted,
  OrderFailed,
};

const char* auditEventTypeToString(AuditEventType type);

// -----------------------------------------------------------------------------
// AuditEvent
// -----------------------------------------------------------------------------
// Append-only log entry. Never mutated or deleted once AuditLog::append()
// has stored it. details is a free-form JSON object (order id, symbol,
// side, quantity, price or failure reason).
// -----------------------------------------------------------------------------
struct AuditEvent {
  std::uint64_t id{};
  AuditEventType type{AuditEventType::OrderCreated};
  std::string actor;
  std::string client_id;
  std::int64_t timestamp_ms{0};
  nlohmann::json details = nlohmann::json::object();
};

}  // namespace domain
}  // namespace folio
