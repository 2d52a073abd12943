#include "folio/execution/order_engine.hpp"
#include "folio/events/holding_update_event.hpp"
#include "folio/events/order_lifecycle_events.hpp"

#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <utility>

namespace folio {

namespace {

std::string formatAmount(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value;
  return out.str();
}

}  // namespace

const char* rejectionCodeToString(RejectionCode code) {
  switch (code) {
    case RejectionCode::None:
      return "NONE";
    case RejectionCode::InvalidOrder:
      return "INVALID_ORDER";
    case RejectionCode::PortfolioNotFound:
      return "PORTFOLIO_NOT_FOUND";
    case RejectionCode::InstrumentNotFound:
      return "INSTRUMENT_NOT_FOUND";
    case RejectionCode::RiskProfileNotFound:
      return "RISK_PROFILE_NOT_FOUND";
    case RejectionCode::SuitabilityFailed:
      return "SUITABILITY_FAILED";
    case RejectionCode::InsufficientCash:
      return "INSUFFICIENT_CASH";
    case RejectionCode::ConcentrationExceeded:
      return "CONCENTRATION_EXCEEDED";
    case RejectionCode::InsufficientHoldings:
      return "INSUFFICIENT_HOLDINGS";
  }
  return "UNKNOWN";
}

const char* executionOutcomeToString(ExecutionOutcome outcome) {
  switch (outcome) {
    case ExecutionOutcome::Executed:
      return "Executed";
    case ExecutionOutcome::Failed:
      return "Failed";
    case ExecutionOutcome::AlreadyTerminal:
      return "AlreadyTerminal";
    case ExecutionOutcome::InProgress:
      return "InProgress";
    case ExecutionOutcome::UnknownOrder:
      return "UnknownOrder";
  }
  return "Unknown";
}

SubmissionResult SubmissionResult::accept(domain::OrderId id, bool duplicate) {
  SubmissionResult result;
  result.accepted = true;
  result.order_id = id;
  result.duplicate = duplicate;
  return result;
}

SubmissionResult SubmissionResult::reject(RejectionCode code,
                                          std::string reason) {
  SubmissionResult result;
  result.code = code;
  result.reason = std::move(reason);
  return result;
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
OrderEngine::OrderEngine(const ITimeProvider& clock,
                         const InstrumentCatalog& catalog,
                         const RiskProfileRegistry& profiles,
                         PortfolioLedger& ledger, OrderStore& orders,
                         TransactionJournal& journal, AuditLog& audit,
                         IFillScheduler& scheduler, EventBus& bus,
                         const domain::EngineLimits& limits)
    : clock_(clock),
      catalog_(catalog),
      profiles_(profiles),
      ledger_(ledger),
      orders_(orders),
      journal_(journal),
      audit_(audit),
      scheduler_(scheduler),
      bus_(bus),
      limits_(limits),
      concentration_(limits.concentration_limit_pct) {}

// -----------------------------------------------------------------------------
// submitOrder: validate, reserve, create Pending, schedule the fill
// -----------------------------------------------------------------------------
SubmissionResult OrderEngine::submitOrder(const domain::OrderRequest& request) {
  // --- Shape ----------------------------------------------------------------
  if (request.portfolio_id.empty() || request.instrument_id.empty()) {
    return rejectSubmission(request, RejectionCode::InvalidOrder,
                            "Portfolio and instrument are required");
  }
  if (request.quantity <= 0) {
    return rejectSubmission(request, RejectionCode::InvalidOrder,
                            "Quantity must be positive");
  }
  if (request.order_type == domain::OrderType::Limit &&
      (!request.limit_price || *request.limit_price <= 0.0)) {
    return rejectSubmission(request, RejectionCode::InvalidOrder,
                            "Limit orders require a positive limit price");
  }

  // --- Resubmission of a known idempotency key ------------------------------
  if (request.idempotency_key && !request.idempotency_key->empty()) {
    if (auto existing = orders_.findByIdempotencyKey(*request.idempotency_key)) {
      std::cout << "[OrderEngine] Duplicate submission for key '"
                << *request.idempotency_key << "' returns order_id="
                << existing->id << "\n";
      return SubmissionResult::accept(existing->id, true);
    }
  }

  // --- Resolve portfolio, instrument, risk profile --------------------------
  auto snapshot = ledger_.snapshot(request.portfolio_id);
  if (!snapshot) {
    return rejectSubmission(request, RejectionCode::PortfolioNotFound,
                            "Portfolio not found");
  }
  auto instrument = catalog_.find(request.instrument_id);
  if (!instrument) {
    return rejectSubmission(request, RejectionCode::InstrumentNotFound,
                            "Instrument not found");
  }
  auto profile = profiles_.find(snapshot->portfolio.client_id);
  if (!profile) {
    return rejectSubmission(request, RejectionCode::RiskProfileNotFound,
                            "Risk profile not found");
  }

  // --- Suitability (both sides) ---------------------------------------------
  SuitabilityResult suitability = suitability_.check(*instrument, *profile);
  if (!suitability.suitable) {
    return rejectSubmission(request, RejectionCode::SuitabilityFailed,
                            suitability.reason);
  }

  const double price = request.order_type == domain::OrderType::Limit
                           ? *request.limit_price
                           : instrument->current_price;
  if (price <= 0.0) {
    return rejectSubmission(request, RejectionCode::InvalidOrder,
                            "Price must be positive (" + formatAmount(price) +
                                " for " + instrument->symbol + ")");
  }
  const double estimated_cost = static_cast<double>(request.quantity) * price;

  // --- Side-specific checks and reservation ---------------------------------
  double reserved_cash = 0.0;
  if (request.side == domain::Side::Buy) {
    std::int64_t held = 0;
    for (const auto& holding : snapshot->holdings) {
      if (holding.instrument_id == request.instrument_id) {
        held = holding.quantity;
      }
    }
    if (held > std::numeric_limits<std::int64_t>::max() - request.quantity) {
      return rejectSubmission(request, RejectionCode::InvalidOrder,
                              "Quantity would overflow the position size");
    }

    auto cash = ledger_.checkCash(request.portfolio_id, estimated_cost);
    if (!cash || !cash->sufficient) {
      const double available = cash ? cash->available : 0.0;
      return rejectSubmission(request, RejectionCode::InsufficientCash,
                              "Insufficient cash: required " +
                                  formatAmount(estimated_cost) +
                                  ", available " + formatAmount(available));
    }

    ConcentrationResult concentration =
        concentration_.check(*snapshot, catalog_, request.instrument_id,
                             request.quantity, estimated_cost);
    if (!concentration.acceptable) {
      return rejectSubmission(
          request, RejectionCode::ConcentrationExceeded,
          "Position would be " +
              formatAmount(concentration.resulting_percentage) +
              "% of portfolio (limit " + formatAmount(concentration.limit) +
              "%)");
    }

    // Re-checked under the portfolio lock; a concurrent submission may have
    // reserved cash since checkCash().
    auto reserved = ledger_.reserveCash(request.portfolio_id, estimated_cost);
    if (!reserved || !reserved->sufficient) {
      const double available = reserved ? reserved->available : 0.0;
      return rejectSubmission(request, RejectionCode::InsufficientCash,
                              "Insufficient cash: required " +
                                  formatAmount(estimated_cost) +
                                  ", available " + formatAmount(available));
    }
    reserved_cash = estimated_cost;
  } else {
    if (!ledger_.reserveHoldings(request.portfolio_id, request.instrument_id,
                                 request.quantity)) {
      auto available = ledger_.availableQuantity(request.portfolio_id,
                                                 request.instrument_id);
      return rejectSubmission(
          request, RejectionCode::InsufficientHoldings,
          "Insufficient holdings: requested " +
              std::to_string(request.quantity) + ", available " +
              std::to_string(available.value_or(0)));
    }
  }

  // --- Create the Pending order ---------------------------------------------
  const std::int64_t now = clock_.now_ms();

  domain::Order order;
  order.id = order_ids_.next_id();
  order.portfolio_id = request.portfolio_id;
  order.instrument_id = request.instrument_id;
  order.side = request.side;
  order.order_type = request.order_type;
  order.quantity = request.quantity;
  if (request.order_type == domain::OrderType::Limit) {
    order.limit_price = request.limit_price;
  }
  order.status = domain::OrderStatus::Pending;
  order.created_by = request.requested_by;
  order.created_at_ms = now;
  order.reserved_cash = reserved_cash;
  if (request.idempotency_key && !request.idempotency_key->empty()) {
    order.idempotency_key = *request.idempotency_key;
  } else {
    order.idempotency_key = request.portfolio_id + "-" +
                            request.instrument_id + "-" +
                            std::to_string(now) + "-" +
                            std::to_string(order.id);
  }

  if (!orders_.insert(order)) {
    // Only a concurrent submission with the same client key gets here.
    releaseReservation(order);
    if (auto existing = orders_.findByIdempotencyKey(order.idempotency_key)) {
      return SubmissionResult::accept(existing->id, true);
    }
    return rejectSubmission(request, RejectionCode::InvalidOrder,
                            "Order could not be stored");
  }

  domain::AuditEvent audit;
  audit.type = domain::AuditEventType::OrderCreated;
  audit.actor = order.created_by;
  audit.client_id = snapshot->portfolio.client_id;
  audit.timestamp_ms = now;
  audit.details = {
      {"order_id", order.id},
      {"portfolio_id", order.portfolio_id},
      {"symbol", instrument->symbol},
      {"side", domain::sideToString(order.side)},
      {"order_type", domain::orderTypeToString(order.order_type)},
      {"quantity", order.quantity},
      {"price", price},
      {"estimated_cost", estimated_cost},
  };
  audit_.append(std::move(audit));

  OrderCreatedEvent created;
  created.order = order;
  created.symbol = instrument->symbol;
  created.timestamp_ms = now;
  created.sequence_id = next_sequence_.fetch_add(1);
  bus_.publish(created);

  scheduler_.schedule(order.id, now + limits_.fill_delay_ms);

  std::cout << "[OrderEngine] Accepted order_id=" << order.id << " "
            << domain::sideToString(order.side) << " " << order.quantity
            << " " << instrument->symbol << " @ " << formatAmount(price)
            << " for " << order.portfolio_id << "\n";

  return SubmissionResult::accept(order.id);
}

// -----------------------------------------------------------------------------
// executeOrder: the fill, at most once per order
// -----------------------------------------------------------------------------
ExecutionOutcome OrderEngine::executeOrder(domain::OrderId order_id) {
  if (!claim(order_id)) {
    std::cerr << "[OrderEngine] WARNING: order_id=" << order_id
              << " is already being executed. Skipping.\n";
    return ExecutionOutcome::InProgress;
  }

  struct ClaimGuard {
    OrderEngine& engine;
    domain::OrderId id;
    ~ClaimGuard() { engine.unclaim(id); }
  } guard{*this, order_id};

  auto order = orders_.find(order_id);
  if (!order) {
    std::cerr << "[OrderEngine] WARNING: execution trigger for unknown "
                 "order_id=" << order_id << ". Skipping.\n";
    return ExecutionOutcome::UnknownOrder;
  }

  if (order->status != domain::OrderStatus::Pending) {
    std::cerr << "[OrderEngine] WARNING: duplicate execution trigger for "
                 "order_id=" << order_id << " (status "
              << domain::orderStatusToString(order->status)
              << "). Skipping.\n";
    return ExecutionOutcome::AlreadyTerminal;
  }

  auto instrument = catalog_.find(order->instrument_id);
  if (!instrument) {
    return failOrder(*order, order->instrument_id, "Instrument not found",
                     true);
  }

  const double price =
      (order->order_type == domain::OrderType::Limit && order->limit_price)
          ? *order->limit_price
          : instrument->current_price;
  if (price <= 0.0) {
    return failOrder(*order, instrument->symbol, "Invalid execution price",
                     true);
  }
  const std::int64_t now = clock_.now_ms();

  FillResult fill = ledger_.applyFill(*order, price, now);
  switch (fill.status) {
    case FillStatus::Applied:
      break;
    case FillStatus::InsufficientCash:
      return failOrder(*order, instrument->symbol,
                       "Insufficient cash at execution", false);
    case FillStatus::InsufficientHoldings:
      return failOrder(*order, instrument->symbol,
                       "Insufficient holdings at execution", false);
    case FillStatus::InvalidFill:
      return failOrder(*order, instrument->symbol,
                       "Invalid execution price or quantity", false);
    case FillStatus::UnknownPortfolio:
      return failOrder(*order, instrument->symbol, "Portfolio not found",
                       false);
  }

  domain::Transaction transaction;
  transaction.portfolio_id = order->portfolio_id;
  transaction.instrument_id = order->instrument_id;
  transaction.type = order->side == domain::Side::Buy
                         ? domain::TransactionType::Buy
                         : domain::TransactionType::Sell;
  transaction.quantity = order->quantity;
  transaction.price = price;
  transaction.amount = fill.amount;
  transaction.realized_gain = fill.realized_gain;
  transaction.timestamp_ms = now;
  transaction.order_id = order->id;

  auto recorded = journal_.append(transaction);
  if (recorded) {
    transaction = *recorded;
  }

  auto executed = orders_.markExecuted(order->id, now, price);
  if (!executed) {
    // The claim and the Pending check above make this unreachable unless
    // something outside the engine transitioned the order.
    std::cerr << "[OrderEngine] ERROR: fill applied but order_id="
              << order->id << " could not be marked EXECUTED\n";
    return ExecutionOutcome::AlreadyTerminal;
  }

  domain::AuditEvent audit;
  audit.type = domain::AuditEventType::OrderExecuted;
  audit.actor = executed->created_by;
  audit.client_id = clientOf(executed->portfolio_id);
  audit.timestamp_ms = now;
  audit.details = {
      {"order_id", executed->id},
      {"portfolio_id", executed->portfolio_id},
      {"symbol", instrument->symbol},
      {"side", domain::sideToString(executed->side)},
      {"quantity", executed->quantity},
      {"price", price},
      {"amount", fill.amount},
  };
  if (fill.realized_gain) {
    audit.details["realized_gain"] = *fill.realized_gain;
  }
  audit_.append(std::move(audit));

  OrderExecutedEvent executed_event;
  executed_event.order = *executed;
  executed_event.transaction = transaction;
  executed_event.symbol = instrument->symbol;
  executed_event.timestamp_ms = now;
  executed_event.sequence_id = next_sequence_.fetch_add(1);
  bus_.publish(executed_event);

  HoldingUpdateEvent holding_event;
  holding_event.holding = fill.holding;
  holding_event.removed = fill.holding_removed;
  holding_event.cash_after = fill.cash_after;
  holding_event.timestamp_ms = now;
  holding_event.sequence_id = next_sequence_.fetch_add(1);
  bus_.publish(holding_event);

  std::cout << "[OrderEngine] Executed order_id=" << executed->id << " "
            << domain::sideToString(executed->side) << " "
            << executed->quantity << " " << instrument->symbol << " @ "
            << formatAmount(price) << ", cash now "
            << formatAmount(fill.cash_after) << "\n";

  return ExecutionOutcome::Executed;
}

std::vector<domain::Order> OrderEngine::getOrderHistory(
    const std::string& portfolio_id) const {
  return orders_.ordersForPortfolio(portfolio_id);
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
SubmissionResult OrderEngine::rejectSubmission(
    const domain::OrderRequest& request, RejectionCode code,
    std::string reason) {
  std::cerr << "[OrderEngine] Rejected " << domain::sideToString(request.side)
            << " " << request.quantity << " " << request.instrument_id
            << " for " << request.portfolio_id << ": "
            << rejectionCodeToString(code) << " (" << reason << ")\n";
  return SubmissionResult::reject(code, std::move(reason));
}

ExecutionOutcome OrderEngine::failOrder(const domain::Order& order,
                                        const std::string& symbol,
                                        const std::string& reason,
                                        bool release_reservation) {
  if (release_reservation) {
    releaseReservation(order);
  }

  auto failed = orders_.markFailed(order.id, reason);
  if (!failed) {
    return ExecutionOutcome::AlreadyTerminal;
  }

  const std::int64_t now = clock_.now_ms();

  domain::AuditEvent audit;
  audit.type = domain::AuditEventType::OrderFailed;
  audit.actor = failed->created_by;
  audit.client_id = clientOf(failed->portfolio_id);
  audit.timestamp_ms = now;
  audit.details = {
      {"order_id", failed->id},
      {"portfolio_id", failed->portfolio_id},
      {"symbol", symbol},
      {"side", domain::sideToString(failed->side)},
      {"quantity", failed->quantity},
      {"reason", reason},
  };
  audit_.append(std::move(audit));

  OrderFailedEvent failed_event;
  failed_event.order = *failed;
  failed_event.timestamp_ms = now;
  failed_event.sequence_id = next_sequence_.fetch_add(1);
  bus_.publish(failed_event);

  std::cerr << "[OrderEngine] Order order_id=" << failed->id
            << " FAILED: " << reason << "\n";

  return ExecutionOutcome::Failed;
}

void OrderEngine::releaseReservation(const domain::Order& order) {
  if (order.side == domain::Side::Buy) {
    ledger_.releaseCash(order.portfolio_id, order.reserved_cash);
  } else {
    ledger_.releaseHoldings(order.portfolio_id, order.instrument_id,
                            order.quantity);
  }
}

std::string OrderEngine::clientOf(const std::string& portfolio_id) const {
  auto snapshot = ledger_.snapshot(portfolio_id);
  return snapshot ? snapshot->portfolio.client_id : std::string{};
}

bool OrderEngine::claim(domain::OrderId id) {
  std::lock_guard lock(in_flight_mutex_);
  return in_flight_.insert(id).second;
}

void OrderEngine::unclaim(domain::OrderId id) {
  std::lock_guard lock(in_flight_mutex_);
  in_flight_.erase(id);
}

}  // namespace folio
