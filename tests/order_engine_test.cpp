// =============================================================================
// order_engine_test.cpp
// =============================================================================
// Tests for folio::OrderEngine: submission checks, reservations, and the
// execution path, driven by a SimulationTimeProvider and a
// SimulatedFillScheduler so every fill runs deterministically on the test
// thread.
//
// Seed data:
//   ins-1  EQUITY       price 50    risk 0..10
//   ins-2  EQUITY       price 50    risk 0..10
//   ins-7  ALTERNATIVE  price 100   risk 7..10
//   port-1 / cli-1 (score 5)  cash 10,000
//   port-3 / cli-3 (score 3)  cash 10,000
//   port-4 / cli-1            cash 1,000 + 180 ins-2 (9,000)
// =============================================================================

#include "folio/execution/order_engine.hpp"
#include "folio/execution/simulated_fill_scheduler.hpp"
#include "folio/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <variant>
#include <vector>

using folio::ExecutionOutcome;
using folio::RejectionCode;
using folio::domain::OrderStatus;
using folio::domain::Side;

class OrderEngineTest : public ::testing::Test {
 protected:
  OrderEngineTest()
      : clock(1'000'000),
        scheduler(clock,
                  [this](folio::domain::OrderId id) { engine.executeOrder(id); }),
        engine(clock, catalog, profiles, ledger, orders, journal, audit,
               scheduler, bus, limits) {}

  void SetUp() override {
    addInstrument("ins-1", "VTI", folio::domain::AssetClass::Equity, 50.0, 0);
    addInstrument("ins-2", "VXUS", folio::domain::AssetClass::Equity, 50.0, 0);
    addInstrument("ins-7", "GLD", folio::domain::AssetClass::Alternative,
                  100.0, 7);

    openPortfolio("port-1", "cli-1", 10000.0);
    openPortfolio("port-3", "cli-3", 10000.0);
    openPortfolio("port-4", "cli-1", 1000.0);
    hold("port-4", "ins-2", 180, 50.0);

    addProfile("cli-1", 5);
    addProfile("cli-3", 3);

    bus.subscribe([this](const folio::Event& e) { events.push_back(e); });
  }

  void addInstrument(const std::string& id, const std::string& symbol,
                     folio::domain::AssetClass asset_class, double price,
                     int risk_rating) {
    folio::domain::Instrument i;
    i.id = id;
    i.symbol = symbol;
    i.name = symbol;
    i.asset_class = asset_class;
    i.current_price = price;
    i.risk_rating = risk_rating;
    ASSERT_TRUE(catalog.add(i));
  }

  void openPortfolio(const std::string& id, const std::string& client,
                     double cash) {
    folio::domain::Portfolio p;
    p.id = id;
    p.client_id = client;
    p.cash = cash;
    ASSERT_TRUE(ledger.openPortfolio(p));
  }

  void hold(const std::string& portfolio, const std::string& instrument,
            std::int64_t qty, double avg) {
    folio::domain::Holding h;
    h.portfolio_id = portfolio;
    h.instrument_id = instrument;
    h.quantity = qty;
    h.average_cost = avg;
    ASSERT_TRUE(ledger.hydrateHolding(h));
  }

  void addProfile(const std::string& client, int score) {
    folio::domain::RiskProfile p;
    p.client_id = client;
    p.score = score;
    p.last_updated_ms = clock.now_ms();
    ASSERT_TRUE(profiles.upsert(p));
  }

  static folio::domain::OrderRequest request(const std::string& portfolio,
                                             const std::string& instrument,
                                             Side side, std::int64_t qty) {
    folio::domain::OrderRequest r;
    r.portfolio_id = portfolio;
    r.instrument_id = instrument;
    r.side = side;
    r.quantity = qty;
    r.requested_by = "advisor-1";
    return r;
  }

  // Advances past the fill delay and runs every due fill.
  std::size_t settle() {
    clock.advance_by(limits.fill_delay_ms);
    return scheduler.runDue();
  }

  double cash(const std::string& portfolio) {
    return ledger.snapshot(portfolio)->portfolio.cash;
  }

  template <typename T>
  int count() const {
    int n = 0;
    for (const auto& e : events) {
      if (std::holds_alternative<T>(e)) ++n;
    }
    return n;
  }

  folio::SimulationTimeProvider clock;
  folio::InstrumentCatalog catalog;
  folio::RiskProfileRegistry profiles;
  folio::PortfolioLedger ledger;
  folio::OrderStore orders;
  folio::TransactionJournal journal;
  folio::AuditLog audit;
  folio::EventBus bus;
  folio::domain::EngineLimits limits;
  folio::SimulatedFillScheduler scheduler;
  folio::OrderEngine engine;
  std::vector<folio::Event> events;
};

// -----------------------------------------------------------------------------
// 1. The basic BUY: 10 @ 50 from 10,000 cash.
// Accepted PENDING, nothing moves until the fill; after it, cash 9,500, one
// holding of 10 @ 50, one BUY transaction of 500, order EXECUTED.
// -----------------------------------------------------------------------------
TEST_F(OrderEngineTest, BuyExecutesAfterFillDelay) {
  auto result = engine.submitOrder(request("port-1", "ins-1", Side::Buy, 10));
  ASSERT_TRUE(result.accepted) << result.reason;
  EXPECT_FALSE(result.duplicate);

  auto order = orders.find(result.order_id);
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->status, OrderStatus::Pending);
  EXPECT_EQ(order->created_by, "advisor-1");
  EXPECT_DOUBLE_EQ(cash("port-1"), 10000.0);
  EXPECT_DOUBLE_EQ(ledger.snapshot("port-1")->reserved_cash, 500.0);

  // Not due yet.
  EXPECT_EQ(scheduler.runDue(), 0u);
  EXPECT_EQ(settle(), 1u);

  order = orders.find(result.order_id);
  EXPECT_EQ(order->status, OrderStatus::Executed);
  EXPECT_EQ(order->executed_at_ms, 1'000'000 + limits.fill_delay_ms);
  EXPECT_DOUBLE_EQ(*order->executed_price, 50.0);

  auto snap = ledger.snapshot("port-1");
  EXPECT_DOUBLE_EQ(snap->portfolio.cash, 9500.0);
  EXPECT_DOUBLE_EQ(snap->reserved_cash, 0.0);
  ASSERT_EQ(snap->holdings.size(), 1u);
  EXPECT_EQ(snap->holdings[0].quantity, 10);
  EXPECT_DOUBLE_EQ(snap->holdings[0].average_cost, 50.0);

  auto txns = journal.forPortfolio("port-1");
  ASSERT_EQ(txns.size(), 1u);
  EXPECT_EQ(txns[0].type, folio::domain::TransactionType::Buy);
  EXPECT_DOUBLE_EQ(txns[0].amount, 500.0);
  EXPECT_EQ(txns[0].order_id, result.order_id);

  EXPECT_EQ(count<folio::OrderCreatedEvent>(), 1);
  EXPECT_EQ(count<folio::OrderExecutedEvent>(), 1);
  EXPECT_EQ(count<folio::HoldingUpdateEvent>(), 1);

  auto trail = audit.forClient("cli-1");
  ASSERT_EQ(trail.size(), 2u);
  EXPECT_EQ(trail[0].type, folio::domain::AuditEventType::OrderCreated);
  EXPECT_EQ(trail[0].details.at("symbol").get<std::string>(), "VTI");
  EXPECT_EQ(trail[1].type, folio::domain::AuditEventType::OrderExecuted);
}

// -----------------------------------------------------------------------------
// 2. Not enough cash: rejected before any order exists.
// -----------------------------------------------------------------------------
TEST_F(OrderEngineTest, InsufficientCashIsRejected) {
  auto result = engine.submitOrder(request("port-1", "ins-1", Side::Buy, 300));

  EXPECT_FALSE(result.accepted);
  EXPECT_EQ(result.code, RejectionCode::InsufficientCash);
  EXPECT_EQ(result.reason,
            "Insufficient cash: required 15000.00, available 10000.00");
  EXPECT_EQ(orders.size(), 0u);
  EXPECT_EQ(audit.size(), 0u);
  EXPECT_TRUE(events.empty());
}

// -----------------------------------------------------------------------------
// 3. Pending BUYs reserve cash, so a second order cannot spend it again.
// -----------------------------------------------------------------------------
TEST_F(OrderEngineTest, PendingBuyReservesCash) {
  auto first = engine.submitOrder(request("port-4", "ins-1", Side::Buy, 20));
  ASSERT_TRUE(first.accepted) << first.reason;

  auto second = engine.submitOrder(request("port-4", "ins-1", Side::Buy, 1));
  EXPECT_FALSE(second.accepted);
  EXPECT_EQ(second.code, RejectionCode::InsufficientCash);
  EXPECT_EQ(second.reason, "Insufficient cash: required 50.00, available 0.00");

  settle();
  EXPECT_DOUBLE_EQ(cash("port-4"), 0.0);
}

// -----------------------------------------------------------------------------
// 4. A conservative client (score 3) may not buy an ALTERNATIVE rated 7.
// -----------------------------------------------------------------------------
TEST_F(OrderEngineTest, UnsuitableInstrumentIsRejected) {
  auto result = engine.submitOrder(request("port-3", "ins-7", Side::Buy, 1));

  EXPECT_FALSE(result.accepted);
  EXPECT_EQ(result.code, RejectionCode::SuitabilityFailed);
  EXPECT_EQ(result.reason,
            "GLD requires minimum risk score of 7. Client risk score is 3.");
  EXPECT_EQ(orders.size(), 0u);
}

// -----------------------------------------------------------------------------
// 5. A BUY that would make one position more than 25% is rejected.
// -----------------------------------------------------------------------------
TEST_F(OrderEngineTest, ConcentrationLimitIsEnforced) {
  auto result = engine.submitOrder(request("port-1", "ins-1", Side::Buy, 60));

  EXPECT_FALSE(result.accepted);
  EXPECT_EQ(result.code, RejectionCode::ConcentrationExceeded);
  EXPECT_EQ(result.reason, "Position would be 30.00% of portfolio (limit 25.00%)");
}

// -----------------------------------------------------------------------------
// 6. Selling the whole position removes the holding and credits cash.
// -----------------------------------------------------------------------------
TEST_F(OrderEngineTest, SellAllRemovesHolding) {
  hold("port-1", "ins-1", 10, 40.0);

  auto result = engine.submitOrder(request("port-1", "ins-1", Side::Sell, 10));
  ASSERT_TRUE(result.accepted) << result.reason;
  settle();

  auto snap = ledger.snapshot("port-1");
  EXPECT_TRUE(snap->holdings.empty());
  EXPECT_DOUBLE_EQ(snap->portfolio.cash, 10500.0);

  auto txn = journal.forOrder(result.order_id);
  ASSERT_TRUE(txn.has_value());
  EXPECT_EQ(txn->type, folio::domain::TransactionType::Sell);
  EXPECT_DOUBLE_EQ(*txn->realized_gain, 100.0);
}

// -----------------------------------------------------------------------------
// 7. SELL beyond the available quantity, counting pending SELLs.
// -----------------------------------------------------------------------------
TEST_F(OrderEngineTest, InsufficientHoldingsIsRejected) {
  auto none = engine.submitOrder(request("port-1", "ins-1", Side::Sell, 5));
  EXPECT_FALSE(none.accepted);
  EXPECT_EQ(none.code, RejectionCode::InsufficientHoldings);
  EXPECT_EQ(none.reason, "Insufficient holdings: requested 5, available 0");

  hold("port-1", "ins-1", 10, 40.0);
  ASSERT_TRUE(
      engine.submitOrder(request("port-1", "ins-1", Side::Sell, 8)).accepted);
  auto over = engine.submitOrder(request("port-1", "ins-1", Side::Sell, 3));
  EXPECT_FALSE(over.accepted);
  EXPECT_EQ(over.reason, "Insufficient holdings: requested 3, available 2");
}

// -----------------------------------------------------------------------------
// 8. A second execution trigger for the same order changes nothing.
// Why: Fills may be triggered twice (retry, duplicate schedule); the ledger
//      must move exactly once.
// -----------------------------------------------------------------------------
TEST_F(OrderEngineTest, DoubleExecutionMutatesOnce) {
  auto result = engine.submitOrder(request("port-1", "ins-1", Side::Buy, 10));
  ASSERT_TRUE(result.accepted);

  EXPECT_EQ(engine.executeOrder(result.order_id), ExecutionOutcome::Executed);
  EXPECT_EQ(engine.executeOrder(result.order_id),
            ExecutionOutcome::AlreadyTerminal);
  // The scheduled fill still fires later; it must be a no-op too.
  settle();

  EXPECT_DOUBLE_EQ(cash("port-1"), 9500.0);
  EXPECT_EQ(ledger.snapshot("port-1")->holdings[0].quantity, 10);
  EXPECT_EQ(journal.size(), 1u);
  EXPECT_EQ(count<folio::OrderExecutedEvent>(), 1);
  EXPECT_EQ(engine.executeOrder(999), ExecutionOutcome::UnknownOrder);
}

// -----------------------------------------------------------------------------
// 9. The instrument disappears before the fill: FAILED, reservation freed.
// -----------------------------------------------------------------------------
TEST_F(OrderEngineTest, MissingInstrumentAtExecutionFails) {
  auto result = engine.submitOrder(request("port-1", "ins-1", Side::Buy, 10));
  ASSERT_TRUE(result.accepted);
  ASSERT_TRUE(catalog.remove("ins-1"));

  settle();

  auto order = orders.find(result.order_id);
  EXPECT_EQ(order->status, OrderStatus::Failed);
  EXPECT_EQ(order->failure_reason, "Instrument not found");

  auto snap = ledger.snapshot("port-1");
  EXPECT_DOUBLE_EQ(snap->portfolio.cash, 10000.0);
  EXPECT_DOUBLE_EQ(snap->reserved_cash, 0.0);
  EXPECT_TRUE(snap->holdings.empty());
  EXPECT_EQ(journal.size(), 0u);
  EXPECT_EQ(count<folio::OrderFailedEvent>(), 1);
  EXPECT_EQ(audit.all().back().details.at("reason").get<std::string>(),
            "Instrument not found");
}

// -----------------------------------------------------------------------------
// 10. Average cost after two BUYs at different prices.
// 10 @ 50 then 10 @ 60 → 20 @ 55.
// -----------------------------------------------------------------------------
TEST_F(OrderEngineTest, AverageCostAcrossBuys) {
  ASSERT_TRUE(
      engine.submitOrder(request("port-1", "ins-1", Side::Buy, 10)).accepted);
  settle();

  ASSERT_TRUE(catalog.updatePrice("ins-1", 60.0));
  ASSERT_TRUE(
      engine.submitOrder(request("port-1", "ins-1", Side::Buy, 10)).accepted);
  settle();

  auto snap = ledger.snapshot("port-1");
  ASSERT_EQ(snap->holdings.size(), 1u);
  EXPECT_EQ(snap->holdings[0].quantity, 20);
  EXPECT_DOUBLE_EQ(snap->holdings[0].average_cost, 55.0);
  EXPECT_DOUBLE_EQ(snap->portfolio.cash, 8900.0);
}

// -----------------------------------------------------------------------------
// 11. Resubmitting a client idempotency key returns the original order.
// -----------------------------------------------------------------------------
TEST_F(OrderEngineTest, IdempotencyKeyReturnsExistingOrder) {
  auto r = request("port-1", "ins-1", Side::Buy, 10);
  r.idempotency_key = "client-key-1";

  auto first = engine.submitOrder(r);
  auto second = engine.submitOrder(r);

  ASSERT_TRUE(first.accepted);
  ASSERT_TRUE(second.accepted);
  EXPECT_TRUE(second.duplicate);
  EXPECT_EQ(second.order_id, first.order_id);
  EXPECT_EQ(orders.size(), 1u);
  EXPECT_DOUBLE_EQ(ledger.snapshot("port-1")->reserved_cash, 500.0);

  settle();
  EXPECT_DOUBLE_EQ(cash("port-1"), 9500.0);
}

// -----------------------------------------------------------------------------
// 12. Generated idempotency keys are unique per order.
// -----------------------------------------------------------------------------
TEST_F(OrderEngineTest, GeneratedKeysAreUnique) {
  auto a = engine.submitOrder(request("port-1", "ins-1", Side::Buy, 1));
  auto b = engine.submitOrder(request("port-1", "ins-1", Side::Buy, 1));
  ASSERT_TRUE(a.accepted);
  ASSERT_TRUE(b.accepted);
  EXPECT_FALSE(b.duplicate);
  EXPECT_NE(orders.find(a.order_id)->idempotency_key,
            orders.find(b.order_id)->idempotency_key);
}

// -----------------------------------------------------------------------------
// 13. Limit orders fill at their limit price; a missing price is invalid.
// -----------------------------------------------------------------------------
TEST_F(OrderEngineTest, LimitOrders) {
  auto missing = request("port-1", "ins-1", Side::Buy, 10);
  missing.order_type = folio::domain::OrderType::Limit;
  auto rejected = engine.submitOrder(missing);
  EXPECT_EQ(rejected.code, RejectionCode::InvalidOrder);
  EXPECT_EQ(rejected.reason, "Limit orders require a positive limit price");

  auto limit = missing;
  limit.limit_price = 45.0;
  auto result = engine.submitOrder(limit);
  ASSERT_TRUE(result.accepted) << result.reason;
  settle();

  EXPECT_DOUBLE_EQ(*orders.find(result.order_id)->executed_price, 45.0);
  EXPECT_DOUBLE_EQ(cash("port-1"), 9550.0);
}

// -----------------------------------------------------------------------------
// 14. Shape and lookup failures.
// -----------------------------------------------------------------------------
TEST_F(OrderEngineTest, InvalidRequests) {
  EXPECT_EQ(engine.submitOrder(request("port-1", "ins-1", Side::Buy, 0)).code,
            RejectionCode::InvalidOrder);
  EXPECT_EQ(engine.submitOrder(request("port-9", "ins-1", Side::Buy, 1)).code,
            RejectionCode::PortfolioNotFound);
  EXPECT_EQ(engine.submitOrder(request("port-1", "ins-9", Side::Buy, 1)).code,
            RejectionCode::InstrumentNotFound);

  openPortfolio("port-5", "cli-5", 100.0);
  EXPECT_EQ(engine.submitOrder(request("port-5", "ins-1", Side::Buy, 1)).code,
            RejectionCode::RiskProfileNotFound);
}

// -----------------------------------------------------------------------------
// 15. History is newest first and covers every status.
// -----------------------------------------------------------------------------
TEST_F(OrderEngineTest, OrderHistoryNewestFirst) {
  auto a = engine.submitOrder(request("port-1", "ins-1", Side::Buy, 1));
  settle();
  auto b = engine.submitOrder(request("port-1", "ins-2", Side::Buy, 1));

  auto history = engine.getOrderHistory("port-1");
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].id, b.order_id);
  EXPECT_EQ(history[0].status, OrderStatus::Pending);
  EXPECT_EQ(history[1].id, a.order_id);
  EXPECT_EQ(history[1].status, OrderStatus::Executed);
  EXPECT_TRUE(engine.getOrderHistory("port-404").empty());
}

// -----------------------------------------------------------------------------
// 16. A zero-priced instrument cannot be ordered.
// Why: cost 0 passes every cash and concentration check, and the fill would
//      store a holding with average_cost 0.
// -----------------------------------------------------------------------------
TEST_F(OrderEngineTest, ZeroPriceIsRejectedAtSubmission) {
  addInstrument("ins-0", "FREE", folio::domain::AssetClass::Equity, 0.0, 0);

  auto result = engine.submitOrder(request("port-1", "ins-0", Side::Buy, 10));
  EXPECT_FALSE(result.accepted);
  EXPECT_EQ(result.code, RejectionCode::InvalidOrder);
  EXPECT_EQ(result.reason, "Price must be positive (0.00 for FREE)");
  EXPECT_EQ(orders.size(), 0u);
  EXPECT_DOUBLE_EQ(ledger.snapshot("port-1")->reserved_cash, 0.0);
}

// -----------------------------------------------------------------------------
// 17. The price drops to 0 between acceptance and the fill: FAILED, ledger
//     untouched, reservation freed.
// -----------------------------------------------------------------------------
TEST_F(OrderEngineTest, ZeroPriceAtExecutionFails) {
  auto result = engine.submitOrder(request("port-1", "ins-1", Side::Buy, 10));
  ASSERT_TRUE(result.accepted);
  ASSERT_TRUE(catalog.updatePrice("ins-1", 0.0));

  settle();

  auto order = orders.find(result.order_id);
  EXPECT_EQ(order->status, OrderStatus::Failed);
  EXPECT_EQ(order->failure_reason, "Invalid execution price");

  auto snap = ledger.snapshot("port-1");
  EXPECT_DOUBLE_EQ(snap->portfolio.cash, 10000.0);
  EXPECT_DOUBLE_EQ(snap->reserved_cash, 0.0);
  EXPECT_TRUE(snap->holdings.empty());
  EXPECT_EQ(journal.size(), 0u);
}

// -----------------------------------------------------------------------------
// 18. Suitability runs before the cash check.
// 200 GLD @ 100 needs 20,000 against 10,000 cash, yet the rejection is the
// suitability one.
// -----------------------------------------------------------------------------
TEST_F(OrderEngineTest, SuitabilityCheckedBeforeCash) {
  auto result = engine.submitOrder(request("port-3", "ins-7", Side::Buy, 200));

  EXPECT_FALSE(result.accepted);
  EXPECT_EQ(result.code, RejectionCode::SuitabilityFailed);
  EXPECT_EQ(orders.size(), 0u);
}

// -----------------------------------------------------------------------------
// 19. Suitability applies to SELL orders too; nothing is reserved.
// -----------------------------------------------------------------------------
TEST_F(OrderEngineTest, UnsuitableSellIsRejected) {
  hold("port-3", "ins-7", 5, 100.0);

  auto result = engine.submitOrder(request("port-3", "ins-7", Side::Sell, 5));

  EXPECT_FALSE(result.accepted);
  EXPECT_EQ(result.code, RejectionCode::SuitabilityFailed);
  EXPECT_EQ(result.reason,
            "GLD requires minimum risk score of 7. Client risk score is 3.");
  EXPECT_EQ(ledger.availableQuantity("port-3", "ins-7"), 5);
  EXPECT_EQ(ledger.snapshot("port-3")->holdings[0].quantity, 5);
}
