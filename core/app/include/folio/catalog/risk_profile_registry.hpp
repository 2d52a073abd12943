#pragma once

#include "folio/domain/risk_profile.hpp"

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace folio {

// -----------------------------------------------------------------------------
// RiskProfileRegistry
// -----------------------------------------------------------------------------
// Responsibility: Client id → RiskProfile lookup. The questionnaire that
// produces profiles lives outside the engine; the engine only reads them.
//
// Thread model: shared_mutex, same as InstrumentCatalog.
// -----------------------------------------------------------------------------
class RiskProfileRegistry {
 public:
  RiskProfileRegistry() = default;

  RiskProfileRegistry(const RiskProfileRegistry&) = delete;
  RiskProfileRegistry& operator=(const RiskProfileRegistry&) = delete;

  // Inserts or replaces the client's profile. Returns false if the score is
  // outside [kMinRiskScore, kMaxRiskScore].
  bool upsert(const domain::RiskProfile& profile);

  std::optional<domain::RiskProfile> find(const std::string& client_id) const;

  // -------------------------------------------------------------------------
  // isStale(profile, now_ms, stale_after_days)
  // -------------------------------------------------------------------------
  // True when the profile was last updated more than stale_after_days
  // before now_ms. Pure function.
  // -------------------------------------------------------------------------
  static bool isStale(const domain::RiskProfile& profile, std::int64_t now_ms,
                      int stale_after_days);

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, domain::RiskProfile> profiles_;
};

}  // namespace folio
