#include "folio/store/audit_log.hpp"

namespace folio {

domain::AuditEvent AuditLog::append(domain::AuditEvent event) {
  std::lock_guard lock(mutex_);
  event.id = ids_.next_id();
  entries_.push_back(event);
  return event;
}

std::vector<domain::AuditEvent> AuditLog::all() const {
  std::lock_guard lock(mutex_);
  return entries_;
}

std::vector<domain::AuditEvent> AuditLog::forClient(
    const std::string& client_id) const {
  std::lock_guard lock(mutex_);
  std::vector<domain::AuditEvent> result;
  for (const auto& entry : entries_) {
    if (entry.client_id == client_id) {
      result.push_back(entry);
    }
  }
  return result;
}

std::size_t AuditLog::size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

}  // namespace folio
