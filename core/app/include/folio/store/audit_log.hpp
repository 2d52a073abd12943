#pragma once

#include "folio/concurrent/id_generator.hpp"
#include "folio/domain/audit_event.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace folio {

// -----------------------------------------------------------------------------
// AuditLog
// -----------------------------------------------------------------------------
// Append-only. append() stamps the id and returns the stored copy; entries
// are never mutated or deleted. Reads return copies in append order.
//
// Thread model: std::mutex.
// -----------------------------------------------------------------------------
class AuditLog {
 public:
  AuditLog() = default;

  AuditLog(const AuditLog&) = delete;
  AuditLog& operator=(const AuditLog&) = delete;

  domain::AuditEvent append(domain::AuditEvent event);

  std::vector<domain::AuditEvent> all() const;
  std::vector<domain::AuditEvent> forClient(const std::string& client_id) const;

  std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  IdGenerator ids_;
  std::vector<domain::AuditEvent> entries_;
};

}  // namespace folio
