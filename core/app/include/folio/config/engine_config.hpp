#pragma once

#include "folio/domain/engine_limits.hpp"
#include "folio/domain/holding.hpp"
#include "folio/domain/instrument.hpp"
#include "folio/domain/model_portfolio.hpp"
#include "folio/domain/portfolio.hpp"
#include "folio/domain/risk_profile.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace folio {

// -----------------------------------------------------------------------------
// ConfigError
// -----------------------------------------------------------------------------
// Thrown by loadEngineConfig()/parseEngineConfig() when the configuration
// is unreadable, malformed, or violates a domain rule. what() names the
// offending element, e.g. "instruments[2].price must be >= 0".
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A portfolio together with the positions it opens with.
struct PortfolioSeed {
  domain::Portfolio portfolio;
  std::vector<domain::Holding> holdings;
};

// -----------------------------------------------------------------------------
// EngineConfig — everything WealthEngine needs to start
// -----------------------------------------------------------------------------
//
// @brief  Thresholds, IPC endpoints, and the seed data the in-memory
//         stores are populated with.
//
// @details
// JSON layout (every top-level key optional):
//
//   {
//     "limits":        { "concentration_limit_pct": 25, ... },
//     "ipc":           { "command_endpoint": "...",
//                        "telemetry_endpoint": "..." },
//     "instruments":   [ { "id", "symbol", "name", "asset_class", "price",
//                          "risk_rating"?, "max_risk_score"?,
//                          "description"? } ],
//     "model_portfolios": [ { "id", "name", "description"?,
//                             "min_risk_score", "max_risk_score",
//                             "targets": { "EQUITY": 60, ... } } ],
//     "portfolios":    [ { "id", "client_id", "cash", "base_currency"?,
//                          "holdings": [ { "instrument_id", "quantity",
//                                          "average_cost" } ] } ],
//     "risk_profiles": [ { "client_id", "score", "category"?,
//                          "last_updated_ms" } ]
//   }
//
// Omitted limits keep the EngineLimits defaults; an omitted
// model_portfolios array means defaultModelPortfolios(). An instrument
// without risk_rating takes defaultRiskRating() of its asset class; a
// profile without category takes the category of its score band.
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::EngineLimits limits;
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string telemetry_endpoint{"tcp://127.0.0.1:5557"};
  std::vector<domain::Instrument> instruments;
  std::vector<domain::ModelPortfolio> model_portfolios;
  std::vector<PortfolioSeed> portfolios;
  std::vector<domain::RiskProfile> risk_profiles;
};

// -----------------------------------------------------------------------------
// parseEngineConfig(json)
// -----------------------------------------------------------------------------
// @throws ConfigError on a missing required key, a wrong type, or a value
//         that fails validation (negative price or cash, non-positive
//         holding quantity or average cost, a holding of an unknown
//         instrument, duplicate ids, risk score outside 0-10, model targets
//         not summing to 100 ± 0.01, model bands with gaps or overlaps).
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const nlohmann::json& root);

// Reads and parses a JSON file. @throws ConfigError.
EngineConfig loadEngineConfig(const std::string& path);

// Risk category of a score band: 0-3 Conservative, 4 Moderate,
// 5 Balanced, 6-7 Growth, 8-10 Aggressive.
domain::RiskCategory categoryForScore(int score);

}  // namespace folio
