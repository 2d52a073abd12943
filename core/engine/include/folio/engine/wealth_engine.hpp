#pragma once

#include "folio/analytics/allocation_calculator.hpp"
#include "folio/analytics/drift_calculator.hpp"
#include "folio/analytics/model_portfolio_selector.hpp"
#include "folio/analytics/portfolio_valuator.hpp"
#include "folio/analytics/rebalance_advisor.hpp"
#include "folio/catalog/instrument_catalog.hpp"
#include "folio/catalog/risk_profile_registry.hpp"
#include "folio/config/engine_config.hpp"
#include "folio/eventbus/event_bus.hpp"
#include "folio/execution/fill_worker.hpp"
#include "folio/execution/order_engine.hpp"
#include "folio/execution/simulated_fill_scheduler.hpp"
#include "folio/ledger/portfolio_ledger.hpp"
#include "folio/network/ipc_server.hpp"
#include "folio/store/audit_log.hpp"
#include "folio/store/order_store.hpp"
#include "folio/store/transaction_journal.hpp"
#include "folio/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace folio {

// How accepted orders reach their fill.
enum class FillMode {
  Worker,     // FillWorker thread, waits for the due time on its own
  Simulated,  // SimulatedFillScheduler; the caller drives runDueFills()
};

// -----------------------------------------------------------------------------
// WealthEngine
// -----------------------------------------------------------------------------
//
// @brief  Programmatic root of the order and allocation engine. Owns the
//         stores, the ledger, the order engine, the fill scheduler, the
//         analytics, and the optional IPC server.
//
// @details
// Construction seeds the catalog, the risk profiles, and the ledger from
// the EngineConfig; nothing runs until start().
//
// Thread layout after start():
//   caller threads   → submitOrder() and queries, synchronous
//   fill worker      → OrderEngine::executeOrder() (FillMode::Worker only)
//   IPC thread       → handleCommand() (only when endpoints configured)
//
// Domain events (order created/executed/failed, holding updates) are
// published on eventBus(). When the IPC server runs, bridges forward them
// to its telemetry queue.
//
// Ownership:
//   WealthEngine
//    ├── catalog_, profiles_, ledger_       (value members, seeded state)
//    ├── orders_, journal_, audit_          (value members, append/guarded)
//    ├── bus_                               (EventBus, value member)
//    ├── scheduler_                         (unique_ptr<IFillScheduler>)
//    ├── order_engine_                      (unique_ptr<OrderEngine>)
//    ├── valuator_, allocations_,
//    │   selector_, advisor_                (value members, stateless)
//    └── ipc_server_                        (unique_ptr<IpcServer>)
// stop() joins the fill worker and the IPC thread before any member is
// destroyed, so neither can call into a destroyed component.
// -----------------------------------------------------------------------------
class WealthEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  clock   Time source for every timestamp; must outlive the
  //                 engine.
  // @param  config  Limits, endpoints, and seed data. Empty
  //                 command/telemetry endpoints disable the IPC server.
  // @param  mode    Worker for the server, Simulated for tests.
  // -------------------------------------------------------------------------
  WealthEngine(const ITimeProvider& clock, const EngineConfig& config,
               FillMode mode = FillMode::Worker);

  ~WealthEngine();

  WealthEngine(const WealthEngine&) = delete;
  WealthEngine& operator=(const WealthEngine&) = delete;
  WealthEngine(WealthEngine&&) = delete;
  WealthEngine& operator=(WealthEngine&&) = delete;

  // Starts the fill worker and, when configured, the IPC server.
  // Idempotent.
  void start();

  // Stops the fill worker, then the IPC server, then drops the telemetry
  // bridge. Orders whose fill had not run stay PENDING until the next
  // start(). Idempotent.
  void stop();

  bool running() const { return running_; }

  // --- Orders -----------------------------------------------------------------
  SubmissionResult submitOrder(const domain::OrderRequest& request);
  ExecutionOutcome executeOrder(domain::OrderId order_id);
  std::vector<domain::Order> getOrderHistory(
      const std::string& portfolio_id) const;
  std::optional<domain::Order> findOrder(domain::OrderId order_id) const;

  // FillMode::Simulated: runs every fill due at clock.now_ms() and returns
  // how many ran. Always 0 in Worker mode.
  std::size_t runDueFills();

  // --- Portfolio analytics ----------------------------------------------------
  // All return std::nullopt for an unknown portfolio.
  std::optional<std::vector<AllocationEntry>> getAllocations(
      const std::string& portfolio_id) const;

  // std::nullopt also when no model matches risk_score.
  std::optional<DriftResult> getDrift(const std::string& portfolio_id,
                                      int risk_score) const;

  std::optional<std::vector<Recommendation>> getRecommendations(
      const std::string& portfolio_id) const;

  std::optional<PortfolioValuation> getPortfolio(
      const std::string& portfolio_id) const;

  // --- Command channel ----------------------------------------------------------
  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  // @brief  Dispatches one JSON command and returns the JSON reply.
  //
  // @details
  // request["command"] selects the operation:
  //   PING            → {"status":"ok","response":"PONG"}
  //   SUBMIT_ORDER    → {"status":"ok","order_id":N,"duplicate":bool}
  //                     or {"status":"rejected","code":...,"reason":...}
  //   ORDER_HISTORY   → {"status":"ok","orders":[...]}
  //   ALLOCATIONS     → {"status":"ok","allocations":[...]}
  //   DRIFT           → {"status":"ok","drift":{...}}; risk_score is
  //                     optional and defaults to the owner's profile score
  //   RECOMMENDATIONS → {"status":"ok","recommendations":[...]}
  //   PORTFOLIO       → {"status":"ok","portfolio":{...}}
  // Anything malformed or unknown → {"status":"error","response":...}.
  // Never throws for bad input.
  // -------------------------------------------------------------------------
  nlohmann::json executeCommand(const nlohmann::json& request);

  // Raw IPC entry point. Accepts a JSON document or a bare command word
  // ("PING") and returns the serialized reply.
  std::string handleCommand(const std::string& raw);

  // --- Collaborators ------------------------------------------------------------
  EventBus& eventBus() { return bus_; }
  InstrumentCatalog& catalog() { return catalog_; }
  const RiskProfileRegistry& riskProfiles() const { return profiles_; }
  RiskProfileRegistry& riskProfiles() { return profiles_; }
  const TransactionJournal& transactions() const { return journal_; }
  const AuditLog& auditLog() const { return audit_; }
  const domain::EngineLimits& limits() const { return limits_; }

 private:
  void seed(const EngineConfig& config);
  void bridgeTelemetry();
  void unbridgeTelemetry();

  nlohmann::json commandError(const std::string& message) const;
  static std::string requirePortfolioId(const nlohmann::json& request);

  const ITimeProvider& clock_;
  const domain::EngineLimits limits_;
  const std::string cmd_endpoint_;
  const std::string pub_endpoint_;
  const FillMode mode_;

  InstrumentCatalog catalog_;
  RiskProfileRegistry profiles_;
  PortfolioLedger ledger_;
  OrderStore orders_;
  TransactionJournal journal_;
  AuditLog audit_;
  EventBus bus_;

  // Exactly one of these is set, matching mode_; scheduler_ owns it.
  FillWorker* fill_worker_{nullptr};
  SimulatedFillScheduler* simulated_scheduler_{nullptr};
  std::unique_ptr<IFillScheduler> scheduler_;
  std::unique_ptr<OrderEngine> order_engine_;

  PortfolioValuator valuator_;
  AllocationCalculator allocations_;
  ModelPortfolioSelector selector_;
  RebalanceAdvisor advisor_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::vector<EventBus::SubscriptionId> telemetry_subs_;

  bool running_{false};
};

}  // namespace folio
