#pragma once

#include <cstdint>

namespace folio {
namespace domain {

// -----------------------------------------------------------------------------
// EngineLimits — engine-wide thresholds
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of the thresholds that drive pre-trade
//         checks, fill scheduling, and portfolio health recommendations.
//
// @details
// Loaded from the "limits" object of the JSON configuration (see
// parseEngineConfig) and copied by value into every component that needs
// them at construction time. No shared mutable state.
//
// All percentages are expressed on a 0-100 scale.
// -----------------------------------------------------------------------------
struct EngineLimits {
  /// Maximum weight (percent of post-trade total value) a single instrument
  /// may reach through a BUY. Inclusive: exactly the limit is acceptable.
  double concentration_limit_pct{25.0};

  /// Drift above which REBALANCE_PORTFOLIO is recommended.
  double rebalance_drift_threshold{8.0};

  /// Drift above which the rebalance recommendation is HIGH priority.
  double high_drift_threshold{15.0};

  /// Cash weight above which INVEST_CASH is recommended (LOW priority).
  double idle_cash_pct{10.0};

  /// Cash weight above which INVEST_CASH becomes MEDIUM priority.
  double high_idle_cash_pct{15.0};

  /// Holding weight above which REDUCE_CONCENTRATION is recommended. This is
  /// advisory and independent of the pre-trade concentration limit.
  double concentration_advisory_pct{40.0};

  /// Age after which a risk profile is considered stale.
  int risk_profile_stale_days{180};

  /// Simulated fill latency between acceptance and execution.
  std::int64_t fill_delay_ms{2000};
};

}  // namespace domain
}  // namespace folio
