#include "folio/config/engine_config.hpp"
#include "folio/analytics/model_portfolio_selector.hpp"
#include "folio/domain/asset_class.hpp"

#include <fstream>
#include <set>

namespace folio {

namespace {

using nlohmann::json;

void requireObject(const json& node, const std::string& where) {
  if (!node.is_object()) {
    throw ConfigError(where + " must be an object");
  }
}

const json& requireArray(const json& node, const char* key) {
  const json& value = node.at(key);
  if (!value.is_array()) {
    throw ConfigError(std::string(key) + " must be an array");
  }
  return value;
}

template <typename T>
T required(const json& node, const char* key, const std::string& where) {
  if (!node.contains(key)) {
    throw ConfigError(where + "." + key + " is required");
  }
  try {
    return node.at(key).get<T>();
  } catch (const json::exception& e) {
    throw ConfigError(where + "." + key + " has the wrong type (" +
                      e.what() + ")");
  }
}

template <typename T>
T optionalOr(const json& node, const char* key, const std::string& where,
           T fallback) {
  if (!node.contains(key) || node.at(key).is_null()) {
    return fallback;
  }
  return required<T>(node, key, where);
}

std::string indexed(const char* array, std::size_t i) {
  return std::string(array) + "[" + std::to_string(i) + "]";
}

domain::AssetClass requireAssetClass(const std::string& name,
                                     const std::string& where) {
  auto asset_class = domain::parseAssetClass(name);
  if (!asset_class) {
    throw ConfigError(where + " has unknown asset class '" + name + "'");
  }
  return *asset_class;
}

void checkRiskScore(int score, const std::string& where) {
  if (score < domain::kMinRiskScore || score > domain::kMaxRiskScore) {
    throw ConfigError(where + " must be between " +
                      std::to_string(domain::kMinRiskScore) + " and " +
                      std::to_string(domain::kMaxRiskScore));
  }
}

void checkNonNegative(double value, const std::string& where) {
  if (value < 0.0) {
    throw ConfigError(where + " must be >= 0");
  }
}

// --- limits -----------------------------------------------------------------
domain::EngineLimits parseLimits(const json& node) {
  const std::string where = "limits";
  requireObject(node, where);

  domain::EngineLimits limits;
  limits.concentration_limit_pct = optionalOr<double>(
      node, "concentration_limit_pct", where, limits.concentration_limit_pct);
  limits.rebalance_drift_threshold =
      optionalOr<double>(node, "rebalance_drift_threshold", where,
                       limits.rebalance_drift_threshold);
  limits.high_drift_threshold = optionalOr<double>(
      node, "high_drift_threshold", where, limits.high_drift_threshold);
  limits.idle_cash_pct =
      optionalOr<double>(node, "idle_cash_pct", where, limits.idle_cash_pct);
  limits.high_idle_cash_pct = optionalOr<double>(
      node, "high_idle_cash_pct", where, limits.high_idle_cash_pct);
  limits.concentration_advisory_pct =
      optionalOr<double>(node, "concentration_advisory_pct", where,
                       limits.concentration_advisory_pct);
  limits.risk_profile_stale_days = optionalOr<int>(
      node, "risk_profile_stale_days", where, limits.risk_profile_stale_days);
  limits.fill_delay_ms = optionalOr<std::int64_t>(node, "fill_delay_ms", where,
                                                limits.fill_delay_ms);

  if (limits.concentration_limit_pct <= 0.0 ||
      limits.concentration_limit_pct > 100.0) {
    throw ConfigError("limits.concentration_limit_pct must be in (0, 100]");
  }
  checkNonNegative(limits.rebalance_drift_threshold,
                   "limits.rebalance_drift_threshold");
  checkNonNegative(limits.idle_cash_pct, "limits.idle_cash_pct");
  checkNonNegative(limits.concentration_advisory_pct,
                   "limits.concentration_advisory_pct");
  if (limits.high_drift_threshold < limits.rebalance_drift_threshold) {
    throw ConfigError(
        "limits.high_drift_threshold must be >= rebalance_drift_threshold");
  }
  if (limits.high_idle_cash_pct < limits.idle_cash_pct) {
    throw ConfigError("limits.high_idle_cash_pct must be >= idle_cash_pct");
  }
  if (limits.risk_profile_stale_days <= 0) {
    throw ConfigError("limits.risk_profile_stale_days must be > 0");
  }
  if (limits.fill_delay_ms < 0) {
    throw ConfigError("limits.fill_delay_ms must be >= 0");
  }
  return limits;
}

// --- instruments ------------------------------------------------------------
domain::Instrument parseInstrument(const json& node, const std::string& where) {
  requireObject(node, where);

  domain::Instrument instrument;
  instrument.id = required<std::string>(node, "id", where);
  instrument.symbol = required<std::string>(node, "symbol", where);
  instrument.name = optionalOr<std::string>(node, "name", where,
                                          instrument.symbol);
  instrument.asset_class = requireAssetClass(
      required<std::string>(node, "asset_class", where),
      where + ".asset_class");
  instrument.current_price = required<double>(node, "price", where);
  instrument.risk_rating =
      optionalOr<int>(node, "risk_rating", where,
                    domain::defaultRiskRating(instrument.asset_class));
  instrument.max_risk_score = optionalOr<int>(node, "max_risk_score", where,
                                            domain::kMaxRiskScore);
  instrument.description =
      optionalOr<std::string>(node, "description", where, std::string{});

  if (instrument.id.empty()) {
    throw ConfigError(where + ".id must not be empty");
  }
  checkNonNegative(instrument.current_price, where + ".price");
  checkRiskScore(instrument.risk_rating, where + ".risk_rating");
  checkRiskScore(instrument.max_risk_score, where + ".max_risk_score");
  if (instrument.risk_rating > instrument.max_risk_score) {
    throw ConfigError(where + ".risk_rating must be <= max_risk_score");
  }
  return instrument;
}

// --- model portfolios -------------------------------------------------------
domain::ModelPortfolio parseModel(const json& node, const std::string& where) {
  requireObject(node, where);

  domain::ModelPortfolio model;
  model.id = required<std::string>(node, "id", where);
  model.name = required<std::string>(node, "name", where);
  model.description =
      optionalOr<std::string>(node, "description", where, std::string{});
  model.min_risk_score = required<int>(node, "min_risk_score", where);
  model.max_risk_score = required<int>(node, "max_risk_score", where);
  checkRiskScore(model.min_risk_score, where + ".min_risk_score");
  checkRiskScore(model.max_risk_score, where + ".max_risk_score");

  if (!node.contains("targets") || !node.at("targets").is_object()) {
    throw ConfigError(where + ".targets must be an object");
  }
  for (const auto& item : node.at("targets").items()) {
    if (!item.value().is_number()) {
      throw ConfigError(where + ".targets." + item.key() +
                        " must be a number");
    }
    model.targets[requireAssetClass(item.key(), where + ".targets")] =
        item.value().get<double>();
  }

  if (auto problem = ModelPortfolioSelector::validateTargets(model)) {
    throw ConfigError(where + ": " + *problem);
  }
  return model;
}

// --- portfolios -------------------------------------------------------------
PortfolioSeed parsePortfolio(const json& node, const std::string& where,
                             const std::set<std::string>& instrument_ids) {
  requireObject(node, where);

  PortfolioSeed seed;
  seed.portfolio.id = required<std::string>(node, "id", where);
  seed.portfolio.client_id = required<std::string>(node, "client_id", where);
  seed.portfolio.cash = required<double>(node, "cash", where);
  seed.portfolio.base_currency =
      optionalOr<std::string>(node, "base_currency", where, std::string("USD"));

  if (seed.portfolio.id.empty()) {
    throw ConfigError(where + ".id must not be empty");
  }
  checkNonNegative(seed.portfolio.cash, where + ".cash");

  if (!node.contains("holdings")) {
    return seed;
  }
  const json& holdings = node.at("holdings");
  if (!holdings.is_array()) {
    throw ConfigError(where + ".holdings must be an array");
  }

  std::set<std::string> seen;
  for (std::size_t i = 0; i < holdings.size(); ++i) {
    const std::string at = where + "." + indexed("holdings", i);
    requireObject(holdings[i], at);

    domain::Holding holding;
    holding.portfolio_id = seed.portfolio.id;
    holding.instrument_id =
        required<std::string>(holdings[i], "instrument_id", at);
    holding.quantity = required<std::int64_t>(holdings[i], "quantity", at);
    holding.average_cost = required<double>(holdings[i], "average_cost", at);

    if (instrument_ids.count(holding.instrument_id) == 0) {
      throw ConfigError(at + " references unknown instrument '" +
                        holding.instrument_id + "'");
    }
    if (!seen.insert(holding.instrument_id).second) {
      throw ConfigError(at + " duplicates instrument '" +
                        holding.instrument_id + "'");
    }
    if (holding.quantity <= 0) {
      throw ConfigError(at + ".quantity must be > 0");
    }
    if (holding.average_cost <= 0.0) {
      throw ConfigError(at + ".average_cost must be > 0");
    }
    seed.holdings.push_back(holding);
  }
  return seed;
}

// --- risk profiles ----------------------------------------------------------
domain::RiskProfile parseRiskProfile(const json& node,
                                     const std::string& where) {
  requireObject(node, where);

  domain::RiskProfile profile;
  profile.client_id = required<std::string>(node, "client_id", where);
  profile.score = required<int>(node, "score", where);
  checkRiskScore(profile.score, where + ".score");
  profile.last_updated_ms =
      required<std::int64_t>(node, "last_updated_ms", where);

  if (node.contains("category")) {
    const std::string name = required<std::string>(node, "category", where);
    auto category = domain::parseRiskCategory(name);
    if (!category) {
      throw ConfigError(where + ".category has unknown value '" + name + "'");
    }
    profile.category = *category;
  } else {
    profile.category = categoryForScore(profile.score);
  }
  return profile;
}

}  // namespace

domain::RiskCategory categoryForScore(int score) {
  if (score <= 3) {
    return domain::RiskCategory::Conservative;
  }
  if (score == 4) {
    return domain::RiskCategory::Moderate;
  }
  if (score == 5) {
    return domain::RiskCategory::Balanced;
  }
  if (score <= 7) {
    return domain::RiskCategory::Growth;
  }
  return domain::RiskCategory::Aggressive;
}

EngineConfig parseEngineConfig(const nlohmann::json& root) {
  requireObject(root, "configuration");

  EngineConfig config;

  if (root.contains("limits")) {
    config.limits = parseLimits(root.at("limits"));
  }

  if (root.contains("ipc")) {
    const json& ipc = root.at("ipc");
    requireObject(ipc, "ipc");
    config.command_endpoint = optionalOr<std::string>(
        ipc, "command_endpoint", "ipc", config.command_endpoint);
    config.telemetry_endpoint = optionalOr<std::string>(
        ipc, "telemetry_endpoint", "ipc", config.telemetry_endpoint);
  }

  std::set<std::string> instrument_ids;
  if (root.contains("instruments")) {
    const json& instruments = requireArray(root, "instruments");
    for (std::size_t i = 0; i < instruments.size(); ++i) {
      const std::string where = indexed("instruments", i);
      domain::Instrument instrument = parseInstrument(instruments[i], where);
      if (!instrument_ids.insert(instrument.id).second) {
        throw ConfigError(where + " duplicates instrument id '" +
                          instrument.id + "'");
      }
      config.instruments.push_back(instrument);
    }
  }

  if (root.contains("model_portfolios")) {
    const json& models = requireArray(root, "model_portfolios");
    for (std::size_t i = 0; i < models.size(); ++i) {
      config.model_portfolios.push_back(
          parseModel(models[i], indexed("model_portfolios", i)));
    }
  } else {
    config.model_portfolios = domain::defaultModelPortfolios();
  }
  if (auto problem =
          ModelPortfolioSelector::validateBands(config.model_portfolios)) {
    throw ConfigError("model_portfolios: " + *problem);
  }

  if (root.contains("portfolios")) {
    const json& portfolios = requireArray(root, "portfolios");
    std::set<std::string> ids;
    for (std::size_t i = 0; i < portfolios.size(); ++i) {
      const std::string where = indexed("portfolios", i);
      PortfolioSeed seed = parsePortfolio(portfolios[i], where, instrument_ids);
      if (!ids.insert(seed.portfolio.id).second) {
        throw ConfigError(where + " duplicates portfolio id '" +
                          seed.portfolio.id + "'");
      }
      config.portfolios.push_back(seed);
    }
  }

  if (root.contains("risk_profiles")) {
    const json& profiles = requireArray(root, "risk_profiles");
    std::set<std::string> clients;
    for (std::size_t i = 0; i < profiles.size(); ++i) {
      const std::string where = indexed("risk_profiles", i);
      domain::RiskProfile profile = parseRiskProfile(profiles[i], where);
      if (!clients.insert(profile.client_id).second) {
        throw ConfigError(where + " duplicates client '" + profile.client_id +
                          "'");
      }
      config.risk_profiles.push_back(profile);
    }
  }

  return config;
}

EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw ConfigError("cannot open configuration file '" + path + "'");
  }

  nlohmann::json root;
  try {
    root = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("'" + path + "' is not valid JSON: " + e.what());
  }
  return parseEngineConfig(root);
}

}  // namespace folio
