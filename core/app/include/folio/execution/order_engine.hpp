#pragma once

#include "folio/catalog/instrument_catalog.hpp"
#include "folio/catalog/risk_profile_registry.hpp"
#include "folio/domain/engine_limits.hpp"
#include "folio/domain/order.hpp"
#include "folio/eventbus/event_bus.hpp"
#include "folio/concurrent/id_generator.hpp"
#include "folio/execution/i_fill_scheduler.hpp"
#include "folio/ledger/portfolio_ledger.hpp"
#include "folio/risk/concentration_checker.hpp"
#include "folio/risk/suitability_checker.hpp"
#include "folio/store/audit_log.hpp"
#include "folio/store/order_store.hpp"
#include "folio/store/transaction_journal.hpp"
#include "folio/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace folio {

// -----------------------------------------------------------------------------
// RejectionCode
// -----------------------------------------------------------------------------
// Why a submission was refused. A rejected submission never creates an
// order, an audit event, or a reservation.
// -----------------------------------------------------------------------------
enum class RejectionCode {
  None,
  InvalidOrder,
  PortfolioNotFound,
  InstrumentNotFound,
  RiskProfileNotFound,
  SuitabilityFailed,
  InsufficientCash,
  ConcentrationExceeded,
  InsufficientHoldings,
};

// "INVALID_ORDER", "INSUFFICIENT_CASH", ... ("NONE" for None).
const char* rejectionCodeToString(RejectionCode code);

// -----------------------------------------------------------------------------
// SubmissionResult
// -----------------------------------------------------------------------------
// accepted: order_id is the Pending order. duplicate is set when the
// request's idempotency key already belonged to an order, in which case
// order_id is that order and nothing new was created.
// rejected: code and reason describe the first check that failed.
// -----------------------------------------------------------------------------
struct SubmissionResult {
  bool accepted{false};
  domain::OrderId order_id{};
  bool duplicate{false};
  RejectionCode code{RejectionCode::None};
  std::string reason;

  static SubmissionResult accept(domain::OrderId id, bool duplicate = false);
  static SubmissionResult reject(RejectionCode code, std::string reason);
};

enum class ExecutionOutcome {
  Executed,         // Fill applied, order Executed
  Failed,           // Order moved to Failed, ledger untouched
  AlreadyTerminal,  // Duplicate trigger; order had already left Pending
  InProgress,       // Another thread is executing this order right now
  UnknownOrder,
};

const char* executionOutcomeToString(ExecutionOutcome outcome);

// -----------------------------------------------------------------------------
// OrderEngine — order validation, state machine, and fill orchestration
// -----------------------------------------------------------------------------
//
// @brief  Accepts or rejects orders synchronously, creates accepted orders
//         in Pending, and executes them when the fill scheduler calls back.
//
// @details
// submitOrder(), in order, stopping at the first failure:
//   1. Shape: quantity > 0; a LIMIT order has limit_price > 0.
//   2. Idempotency key supplied and already used → the existing order is
//      returned as a duplicate.
//   3. Portfolio, instrument, and the portfolio owner's risk profile must
//      all resolve.
//   4. SuitabilityChecker (both sides).
//   5. Pricing price (limit_price, else the catalog price) must be > 0.
//   6. BUY: cash sufficiency against available cash, then
//      ConcentrationChecker, then the estimated cost is reserved.
//      SELL: the quantity is reserved against the free holding.
//   7. Order stored Pending, ORDER_CREATED audited, OrderCreatedEvent
//      published, fill scheduled at now + fill_delay_ms.
//
// executeOrder(), invoked by the scheduler:
//   a. Claims the order id; a concurrent second trigger gets InProgress.
//   b. Checks status == Pending; anything else is a no-op.
//   c. Re-resolves the instrument; gone → Failed "Instrument not found".
//   d. Price = limit_price for LIMIT, else current catalog price; a price
//      ≤ 0 → Failed "Invalid execution price".
//   e. PortfolioLedger::applyFill() moves cash and holdings as one unit.
//   f. Appends the Transaction, marks Executed, audits, publishes
//      OrderExecutedEvent and HoldingUpdateEvent.
// Any failure after acceptance releases the order's reservation and
// leaves cash and holdings unchanged.
//
// Events are published on the EventBus passed in, synchronously on the
// calling thread (the submitter's for OrderCreatedEvent, the fill
// thread's for the rest).
//
// Thread model:
//   submitOrder() is safe from any number of threads. executeOrder() is
//   safe to call concurrently, although the schedulers call it from one
//   thread. All shared state lives in the injected stores and the ledger,
//   each of which is internally synchronized.
//
// Ownership:
//   Owned by WealthEngine. Every collaborator is held by reference and
//   must outlive the engine.
// -----------------------------------------------------------------------------
class OrderEngine {
 public:
  OrderEngine(const ITimeProvider& clock, const InstrumentCatalog& catalog,
              const RiskProfileRegistry& profiles, PortfolioLedger& ledger,
              OrderStore& orders, TransactionJournal& journal,
              AuditLog& audit, IFillScheduler& scheduler, EventBus& bus,
              const domain::EngineLimits& limits);

  OrderEngine(const OrderEngine&) = delete;
  OrderEngine& operator=(const OrderEngine&) = delete;

  SubmissionResult submitOrder(const domain::OrderRequest& request);

  // -------------------------------------------------------------------------
  // executeOrder(order_id)
  // -------------------------------------------------------------------------
  // @brief  Fills a Pending order exactly once.
  //
  // @details
  // Safe to call repeatedly for the same id: only the first call that
  // finds the order Pending mutates anything.
  // -------------------------------------------------------------------------
  ExecutionOutcome executeOrder(domain::OrderId order_id);

  // Newest first.
  std::vector<domain::Order> getOrderHistory(
      const std::string& portfolio_id) const;

 private:
  SubmissionResult rejectSubmission(const domain::OrderRequest& request,
                                    RejectionCode code, std::string reason);

  ExecutionOutcome failOrder(const domain::Order& order,
                             const std::string& symbol,
                             const std::string& reason,
                             bool release_reservation);

  void releaseReservation(const domain::Order& order);

  std::string clientOf(const std::string& portfolio_id) const;

  bool claim(domain::OrderId id);
  void unclaim(domain::OrderId id);

  const ITimeProvider& clock_;
  const InstrumentCatalog& catalog_;
  const RiskProfileRegistry& profiles_;
  PortfolioLedger& ledger_;
  OrderStore& orders_;
  TransactionJournal& journal_;
  AuditLog& audit_;
  IFillScheduler& scheduler_;
  EventBus& bus_;
  const domain::EngineLimits limits_;

  SuitabilityChecker suitability_;
  ConcentrationChecker concentration_;

  IdGenerator order_ids_;
  std::atomic<std::uint64_t> next_sequence_{1};

  std::mutex in_flight_mutex_;
  std::unordered_set<domain::OrderId> in_flight_;
};

}  // namespace folio
