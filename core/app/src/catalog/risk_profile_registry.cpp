#include "folio/catalog/risk_profile_registry.hpp"
#include "folio/time/i_time_provider.hpp"

#include <mutex>

namespace folio {

bool RiskProfileRegistry::upsert(const domain::RiskProfile& profile) {
  if (profile.score < domain::kMinRiskScore ||
      profile.score > domain::kMaxRiskScore) {
    return false;
  }
  std::unique_lock lock(mutex_);
  profiles_[profile.client_id] = profile;
  return true;
}

std::optional<domain::RiskProfile> RiskProfileRegistry::find(
    const std::string& client_id) const {
  std::shared_lock lock(mutex_);
  auto it = profiles_.find(client_id);
  if (it == profiles_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool RiskProfileRegistry::isStale(const domain::RiskProfile& profile,
                                  std::int64_t now_ms, int stale_after_days) {
  std::int64_t age_ms = now_ms - profile.last_updated_ms;
  return age_ms > static_cast<std::int64_t>(stale_after_days) * kMillisPerDay;
}

}  // namespace folio
