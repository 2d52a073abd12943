// =============================================================================
// order_store_test.cpp
// =============================================================================
// Unit tests for the order record keeping:
//   - OrderStateMachine: PENDING → EXECUTED | FAILED, terminal states final
//   - OrderStore: insert, idempotency keys, one transition per order, history
//     ordering
//   - TransactionJournal: at most one transaction per order
//   - AuditLog: ids assigned on append, filtering by client
// =============================================================================

#include "folio/store/audit_log.hpp"
#include "folio/store/order_state_machine.hpp"
#include "folio/store/order_store.hpp"
#include "folio/store/transaction_journal.hpp"

#include <gtest/gtest.h>

using folio::domain::OrderStatus;

namespace {

folio::domain::Order pending(folio::domain::OrderId id,
                             std::int64_t created_at_ms,
                             const std::string& key = "") {
  folio::domain::Order o;
  o.id = id;
  o.portfolio_id = "port-1";
  o.instrument_id = "ins-1";
  o.quantity = 10;
  o.created_at_ms = created_at_ms;
  o.idempotency_key = key;
  return o;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Only PENDING → EXECUTED and PENDING → FAILED are legal.
// -----------------------------------------------------------------------------
TEST(OrderStateMachineTest, Transitions) {
  using SM = folio::OrderStateMachine;

  EXPECT_TRUE(SM::transitionStatus(OrderStatus::Pending, OrderStatus::Executed));
  EXPECT_TRUE(SM::transitionStatus(OrderStatus::Pending, OrderStatus::Failed));

  EXPECT_FALSE(SM::transitionStatus(OrderStatus::Executed, OrderStatus::Failed));
  EXPECT_FALSE(SM::transitionStatus(OrderStatus::Failed, OrderStatus::Executed));
  EXPECT_FALSE(SM::transitionStatus(OrderStatus::Executed, OrderStatus::Executed));
  EXPECT_FALSE(SM::transitionStatus(OrderStatus::Pending, OrderStatus::Pending));

  EXPECT_FALSE(SM::isTerminal(OrderStatus::Pending));
  EXPECT_TRUE(SM::isTerminal(OrderStatus::Executed));
  EXPECT_TRUE(SM::isTerminal(OrderStatus::Failed));
}

// -----------------------------------------------------------------------------
// 2. Insert refuses duplicate ids, duplicate keys, and non-PENDING orders.
// -----------------------------------------------------------------------------
TEST(OrderStoreTest, InsertValidates) {
  folio::OrderStore store;
  ASSERT_TRUE(store.insert(pending(1, 100, "key-a")));

  EXPECT_FALSE(store.insert(pending(1, 100)));
  EXPECT_FALSE(store.insert(pending(2, 100, "key-a")));

  auto done = pending(3, 100);
  done.status = OrderStatus::Executed;
  EXPECT_FALSE(store.insert(done));

  EXPECT_EQ(store.size(), 1u);
  ASSERT_TRUE(store.findByIdempotencyKey("key-a").has_value());
  EXPECT_EQ(store.findByIdempotencyKey("key-a")->id, 1u);
  EXPECT_FALSE(store.findByIdempotencyKey("key-b").has_value());
}

// -----------------------------------------------------------------------------
// 3. An order transitions once; the second attempt is refused.
// Why: A duplicated fill must not flip an EXECUTED order to FAILED or record
//      a second execution price.
// -----------------------------------------------------------------------------
TEST(OrderStoreTest, SingleTransition) {
  folio::OrderStore store;
  ASSERT_TRUE(store.insert(pending(1, 100)));
  ASSERT_TRUE(store.insert(pending(2, 100)));

  auto executed = store.markExecuted(1, 2100, 50.0);
  ASSERT_TRUE(executed.has_value());
  EXPECT_EQ(executed->status, OrderStatus::Executed);
  EXPECT_EQ(executed->executed_at_ms, 2100);
  EXPECT_DOUBLE_EQ(*executed->executed_price, 50.0);

  EXPECT_FALSE(store.markFailed(1, "late").has_value());
  EXPECT_FALSE(store.markExecuted(1, 9999, 1.0).has_value());
  EXPECT_DOUBLE_EQ(*store.find(1)->executed_price, 50.0);

  auto failed = store.markFailed(2, "Instrument not found");
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->failure_reason, "Instrument not found");

  EXPECT_FALSE(store.markExecuted(99, 0, 1.0).has_value());
  EXPECT_TRUE(store.pendingOrderIds().empty());
}

// -----------------------------------------------------------------------------
// 4. History is newest first, ties broken by id descending.
// -----------------------------------------------------------------------------
TEST(OrderStoreTest, HistoryOrdering) {
  folio::OrderStore store;
  ASSERT_TRUE(store.insert(pending(1, 100)));
  ASSERT_TRUE(store.insert(pending(2, 300)));
  ASSERT_TRUE(store.insert(pending(3, 300)));
  auto other = pending(4, 500);
  other.portfolio_id = "port-2";
  ASSERT_TRUE(store.insert(other));

  auto history = store.ordersForPortfolio("port-1");
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history[0].id, 3u);
  EXPECT_EQ(history[1].id, 2u);
  EXPECT_EQ(history[2].id, 1u);

  EXPECT_TRUE(store.ordersForPortfolio("port-404").empty());
  EXPECT_EQ(store.pendingOrderIds(),
            (std::vector<folio::domain::OrderId>{1, 2, 3, 4}));
}

// -----------------------------------------------------------------------------
// 5. The journal keeps one transaction per order and numbers entries.
// -----------------------------------------------------------------------------
TEST(TransactionJournalTest, OneTransactionPerOrder) {
  folio::TransactionJournal journal;

  folio::domain::Transaction t;
  t.portfolio_id = "port-1";
  t.instrument_id = "ins-1";
  t.quantity = 10;
  t.price = 50.0;
  t.amount = 500.0;
  t.order_id = 7;

  auto first = journal.append(t);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->id, 1u);
  EXPECT_FALSE(journal.append(t).has_value());

  folio::domain::Transaction fee;
  fee.portfolio_id = "port-1";
  fee.type = folio::domain::TransactionType::Fee;
  fee.amount = 4.95;
  EXPECT_EQ(journal.append(fee)->id, 2u);

  EXPECT_EQ(journal.size(), 2u);
  EXPECT_EQ(journal.forPortfolio("port-1").size(), 2u);
  EXPECT_DOUBLE_EQ(journal.forOrder(7)->amount, 500.0);
  EXPECT_FALSE(journal.forOrder(8).has_value());
}

// -----------------------------------------------------------------------------
// 6. Audit entries get sequential ids and can be filtered by client.
// -----------------------------------------------------------------------------
TEST(AuditLogTest, AppendAndFilter) {
  folio::AuditLog log;

  folio::domain::AuditEvent e;
  e.type = folio::domain::AuditEventType::OrderCreated;
  e.actor = "advisor-1";
  e.client_id = "cli-1";
  e.details["order_id"] = 1;
  EXPECT_EQ(log.append(e).id, 1u);

  e.client_id = "cli-2";
  e.type = folio::domain::AuditEventType::OrderFailed;
  EXPECT_EQ(log.append(e).id, 2u);

  auto cli1 = log.forClient("cli-1");
  ASSERT_EQ(cli1.size(), 1u);
  EXPECT_EQ(cli1[0].details.at("order_id").get<int>(), 1);
  EXPECT_EQ(log.all().size(), 2u);
  EXPECT_EQ(log.size(), 2u);
}
