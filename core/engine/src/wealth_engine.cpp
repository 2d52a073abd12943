#include "folio/engine/wealth_engine.hpp"
#include "folio/events/holding_update_event.hpp"
#include "folio/events/order_lifecycle_events.hpp"
#include "folio/network/json_codec.hpp"

#include <iostream>
#include <utility>

namespace folio {

namespace {

std::vector<domain::ModelPortfolio> modelsOrDefault(
    const std::vector<domain::ModelPortfolio>& models) {
  return models.empty() ? domain::defaultModelPortfolios() : models;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build components and seed state; no threads yet
// -----------------------------------------------------------------------------
WealthEngine::WealthEngine(const ITimeProvider& clock,
                           const EngineConfig& config, FillMode mode)
    : clock_(clock),
      limits_(config.limits),
      cmd_endpoint_(config.command_endpoint),
      pub_endpoint_(config.telemetry_endpoint),
      mode_(mode),
      valuator_(catalog_),
      selector_(modelsOrDefault(config.model_portfolios)),
      advisor_(config.limits) {
  auto handler = [this](domain::OrderId id) { order_engine_->executeOrder(id); };

  if (mode_ == FillMode::Worker) {
    auto worker = std::make_unique<FillWorker>(clock_, handler);
    fill_worker_ = worker.get();
    scheduler_ = std::move(worker);
  } else {
    auto simulated = std::make_unique<SimulatedFillScheduler>(clock_, handler);
    simulated_scheduler_ = simulated.get();
    scheduler_ = std::move(simulated);
  }

  order_engine_ = std::make_unique<OrderEngine>(
      clock_, catalog_, profiles_, ledger_, orders_, journal_, audit_,
      *scheduler_, bus_, limits_);

  seed(config);
}

WealthEngine::~WealthEngine() { stop(); }

void WealthEngine::seed(const EngineConfig& config) {
  for (const auto& instrument : config.instruments) {
    if (!catalog_.add(instrument)) {
      std::cerr << "[WealthEngine] Skipping duplicate instrument '"
                << instrument.id << "'\n";
    }
  }
  for (const auto& profile : config.risk_profiles) {
    if (!profiles_.upsert(profile)) {
      std::cerr << "[WealthEngine] Skipping risk profile for client '"
                << profile.client_id << "'\n";
    }
  }
  for (const auto& seed : config.portfolios) {
    if (!ledger_.openPortfolio(seed.portfolio)) {
      continue;
    }
    for (const auto& holding : seed.holdings) {
      if (!ledger_.hydrateHolding(holding)) {
        std::cerr << "[WealthEngine] Skipping holding " << holding.instrument_id
                  << " in portfolio '" << seed.portfolio.id << "'\n";
      }
    }
  }

  std::cout << "[WealthEngine] Loaded " << catalog_.size() << " instruments, "
            << config.portfolios.size() << " portfolios, "
            << selector_.models().size() << " model portfolios.\n";
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void WealthEngine::start() {
  if (running_) {
    return;
  }

  if (fill_worker_ != nullptr) {
    fill_worker_->start();
  }
  // Set before the IPC bind so a failed start() can still be undone by
  // stop().
  running_ = true;

  if (!cmd_endpoint_.empty() && !pub_endpoint_.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return handleCommand(cmd); },
        cmd_endpoint_, pub_endpoint_);
    ipc_server_->start();
    bridgeTelemetry();
  }

  std::cout << "[WealthEngine] started. Fill mode: "
            << (mode_ == FillMode::Worker ? "worker" : "simulated")
            << (ipc_server_ ? ", IPC enabled" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void WealthEngine::stop() {
  if (!running_) {
    return;
  }

  // Producers first: the fill thread and the IPC thread both publish on
  // bus_, and the telemetry bridge forwards into ipc_server_.

  // --- 1) No more fills -------------------------------------------------------
  if (fill_worker_ != nullptr) {
    fill_worker_->stop();
  }

  // --- 2) No more commands; the last telemetry is flushed ---------------------
  if (ipc_server_) {
    ipc_server_->stop();
  }

  // --- 3) Nothing publishes now, so the bridge and server can go --------------
  unbridgeTelemetry();
  ipc_server_.reset();

  running_ = false;

  const std::size_t pending = orders_.pendingOrderIds().size();
  std::cout << "[WealthEngine] stopped. " << pending
            << " order(s) still PENDING.\n";
}

void WealthEngine::bridgeTelemetry() {
  auto forward = [this](const Event& event) {
    if (std::holds_alternative<ExecutionRequestEvent>(event)) {
      return;
    }
    if (ipc_server_) {
      ipc_server_->pushTelemetry(event);
    }
  };
  telemetry_subs_.push_back(bus_.subscribe(forward));
}

void WealthEngine::unbridgeTelemetry() {
  for (auto id : telemetry_subs_) {
    bus_.unsubscribe(id);
  }
  telemetry_subs_.clear();
}

// -----------------------------------------------------------------------------
// Orders
// -----------------------------------------------------------------------------
SubmissionResult WealthEngine::submitOrder(
    const domain::OrderRequest& request) {
  return order_engine_->submitOrder(request);
}

ExecutionOutcome WealthEngine::executeOrder(domain::OrderId order_id) {
  return order_engine_->executeOrder(order_id);
}

std::vector<domain::Order> WealthEngine::getOrderHistory(
    const std::string& portfolio_id) const {
  return order_engine_->getOrderHistory(portfolio_id);
}

std::optional<domain::Order> WealthEngine::findOrder(
    domain::OrderId order_id) const {
  return orders_.find(order_id);
}

std::size_t WealthEngine::runDueFills() {
  if (simulated_scheduler_ == nullptr) {
    return 0;
  }
  return simulated_scheduler_->runDue();
}

// -----------------------------------------------------------------------------
// Analytics
// -----------------------------------------------------------------------------
std::optional<std::vector<AllocationEntry>> WealthEngine::getAllocations(
    const std::string& portfolio_id) const {
  auto snapshot = ledger_.snapshot(portfolio_id);
  if (!snapshot) {
    return std::nullopt;
  }
  return allocations_.calculate(valuator_.value(*snapshot));
}

std::optional<DriftResult> WealthEngine::getDrift(
    const std::string& portfolio_id, int risk_score) const {
  auto allocation = getAllocations(portfolio_id);
  if (!allocation) {
    return std::nullopt;
  }
  auto model = selector_.select(risk_score);
  if (!model) {
    return std::nullopt;
  }

  DriftResult result;
  result.model_id = model->id;
  result.model_name = model->name;
  result.drift_percentage = DriftCalculator::drift(
      AllocationCalculator::toPercentages(*allocation), model->targets);
  return result;
}

std::optional<std::vector<Recommendation>> WealthEngine::getRecommendations(
    const std::string& portfolio_id) const {
  auto snapshot = ledger_.snapshot(portfolio_id);
  if (!snapshot) {
    return std::nullopt;
  }

  PortfolioValuation valuation = valuator_.value(*snapshot);
  auto profile = profiles_.find(snapshot->portfolio.client_id);

  std::optional<DriftResult> drift;
  if (profile) {
    drift = getDrift(portfolio_id, profile->score);
  }

  return advisor_.advise(valuation, profile, drift, clock_.now_ms());
}

std::optional<PortfolioValuation> WealthEngine::getPortfolio(
    const std::string& portfolio_id) const {
  auto snapshot = ledger_.snapshot(portfolio_id);
  if (!snapshot) {
    return std::nullopt;
  }
  return valuator_.value(*snapshot);
}

// -----------------------------------------------------------------------------
// Command channel
// -----------------------------------------------------------------------------
nlohmann::json WealthEngine::commandError(const std::string& message) const {
  std::cerr << "[WealthEngine] Command error: " << message << "\n";
  nlohmann::json response;
  response["status"] = "error";
  response["response"] = message;
  return response;
}

std::string WealthEngine::requirePortfolioId(const nlohmann::json& request) {
  if (!request.contains("portfolio_id")) {
    throw CommandError("missing field 'portfolio_id'");
  }
  return request.at("portfolio_id").get<std::string>();
}

nlohmann::json WealthEngine::executeCommand(const nlohmann::json& request) {
  if (!request.is_object() || !request.contains("command") ||
      !request.at("command").is_string()) {
    return commandError("Request must be an object with a 'command' string");
  }

  const std::string command = request.at("command").get<std::string>();
  nlohmann::json response;
  response["status"] = "ok";

  try {
    if (command == "PING") {
      response["response"] = "PONG";

    } else if (command == "SUBMIT_ORDER") {
      SubmissionResult result = submitOrder(orderRequestFromJson(request));
      if (result.accepted) {
        response["order_id"] = result.order_id;
        response["duplicate"] = result.duplicate;
      } else {
        response["status"] = "rejected";
        response["code"] = rejectionCodeToString(result.code);
        response["reason"] = result.reason;
      }

    } else if (command == "ORDER_HISTORY") {
      nlohmann::json orders = nlohmann::json::array();
      for (const auto& order : getOrderHistory(requirePortfolioId(request))) {
        orders.push_back(toJson(order));
      }
      response["orders"] = orders;

    } else if (command == "ALLOCATIONS") {
      const std::string portfolio_id = requirePortfolioId(request);
      auto allocations = getAllocations(portfolio_id);
      if (!allocations) {
        return commandError("Portfolio not found: " + portfolio_id);
      }
      nlohmann::json entries = nlohmann::json::array();
      for (const auto& entry : *allocations) {
        entries.push_back(toJson(entry));
      }
      response["allocations"] = entries;

    } else if (command == "DRIFT") {
      const std::string portfolio_id = requirePortfolioId(request);
      std::optional<int> score;
      if (request.contains("risk_score")) {
        score = request.at("risk_score").get<int>();
      } else if (auto snapshot = ledger_.snapshot(portfolio_id)) {
        if (auto profile = profiles_.find(snapshot->portfolio.client_id)) {
          score = profile->score;
        }
      }
      if (!score) {
        return commandError("No risk score for portfolio: " + portfolio_id);
      }
      auto drift = getDrift(portfolio_id, *score);
      if (!drift) {
        return commandError("No drift for portfolio " + portfolio_id +
                            " at risk score " + std::to_string(*score));
      }
      response["drift"] = toJson(*drift);

    } else if (command == "RECOMMENDATIONS") {
      const std::string portfolio_id = requirePortfolioId(request);
      auto recommendations = getRecommendations(portfolio_id);
      if (!recommendations) {
        return commandError("Portfolio not found: " + portfolio_id);
      }
      nlohmann::json entries = nlohmann::json::array();
      for (const auto& rec : *recommendations) {
        entries.push_back(toJson(rec));
      }
      response["recommendations"] = entries;

    } else if (command == "PORTFOLIO") {
      const std::string portfolio_id = requirePortfolioId(request);
      auto valuation = getPortfolio(portfolio_id);
      if (!valuation) {
        return commandError("Portfolio not found: " + portfolio_id);
      }
      response["portfolio"] = toJson(*valuation);

    } else {
      return commandError("Unknown command: " + command);
    }
  } catch (const CommandError& e) {
    return commandError(e.what());
  } catch (const nlohmann::json::exception& e) {
    return commandError(std::string("Malformed request: ") + e.what());
  }

  return response;
}

std::string WealthEngine::handleCommand(const std::string& raw) {
  nlohmann::json request = nlohmann::json::parse(raw, nullptr, false);
  if (request.is_discarded()) {
    // Bare command word, as sent by simple REQ clients ("PING").
    request = nlohmann::json{{"command", raw}};
  }
  return executeCommand(request).dump();
}

}  // namespace folio
