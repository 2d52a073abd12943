// =============================================================================
// wealth_engine_test.cpp
// =============================================================================
// End-to-end tests for folio::WealthEngine driven through its programmatic
// API and its JSON command channel.
//
// The engine runs with FillMode::Simulated and no IPC endpoints, so fills
// happen only when the test advances the clock and calls runDueFills().
//
// Seed portfolio port-1 (total value 10,000):
//   cash 5,000 | VTI 30 @ 100 = 3,000 EQUITY | BND 40 @ 50 = 2,000 FIXED_INCOME
// Owner cli-1 has risk score 5 (Balanced model: 60/30/5/5).
// =============================================================================

#include "folio/engine/wealth_engine.hpp"
#include "folio/time/i_time_provider.hpp"
#include "folio/time/live_time_provider.hpp"
#include "folio/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using nlohmann::json;

namespace {

constexpr std::int64_t kNow = 400 * folio::kMillisPerDay;

json engineConfig() {
  json config = json::parse(R"({
    "limits": { "fill_delay_ms": 2000 },
    "ipc": { "command_endpoint": "", "telemetry_endpoint": "" },
    "instruments": [
      { "id": "ins-1", "symbol": "VTI", "name": "Vanguard Total Stock Market",
        "asset_class": "EQUITY", "price": 100, "risk_rating": 5 },
      { "id": "ins-2", "symbol": "BND", "name": "Vanguard Total Bond Market",
        "asset_class": "FIXED_INCOME", "price": 50, "risk_rating": 2 }
    ],
    "portfolios": [
      { "id": "port-1", "client_id": "cli-1", "cash": 5000,
        "holdings": [
          { "instrument_id": "ins-1", "quantity": 30, "average_cost": 90 },
          { "instrument_id": "ins-2", "quantity": 40, "average_cost": 50 }
        ] },
      { "id": "port-9", "client_id": "cli-9", "cash": 100 }
    ]
  })");
  config["risk_profiles"] = json::array(
      {{{"client_id", "cli-1"},
        {"score", 5},
        {"last_updated_ms", kNow - 10 * folio::kMillisPerDay}}});
  return config;
}

json submitBody(const std::string& instrument_id, std::int64_t quantity) {
  return json{{"command", "SUBMIT_ORDER"},
              {"portfolio_id", "port-1"},
              {"instrument_id", instrument_id},
              {"side", "BUY"},
              {"quantity", quantity}};
}

}  // namespace

class WealthEngineTest : public ::testing::Test {
 protected:
  WealthEngineTest()
      : clock(kNow),
        engine(clock, folio::parseEngineConfig(engineConfig()),
               folio::FillMode::Simulated) {}

  void settle() {
    clock.advance_by(engine.limits().fill_delay_ms);
    engine.runDueFills();
  }

  folio::SimulationTimeProvider clock;
  folio::WealthEngine engine;
};

// -----------------------------------------------------------------------------
// 1. Seed data is loaded into the catalog, profiles, and ledger.
// -----------------------------------------------------------------------------
TEST_F(WealthEngineTest, SeedsFromConfig) {
  EXPECT_EQ(engine.catalog().all().size(), 2u);
  EXPECT_TRUE(engine.riskProfiles().find("cli-1").has_value());

  auto portfolio = engine.getPortfolio("port-1");
  ASSERT_TRUE(portfolio.has_value());
  EXPECT_DOUBLE_EQ(portfolio->portfolio.cash, 5000.0);
  EXPECT_DOUBLE_EQ(portfolio->holdings_value, 5000.0);
  EXPECT_DOUBLE_EQ(portfolio->total_value, 10000.0);
  EXPECT_FALSE(engine.getPortfolio("port-404").has_value());
}

// -----------------------------------------------------------------------------
// 2. PING answers PONG, also as a bare word on the raw entry point.
// -----------------------------------------------------------------------------
TEST_F(WealthEngineTest, Ping) {
  json reply = engine.executeCommand(json{{"command", "PING"}});
  EXPECT_EQ(reply.at("status"), "ok");
  EXPECT_EQ(reply.at("response"), "PONG");

  json raw = json::parse(engine.handleCommand("PING"));
  EXPECT_EQ(raw.at("response"), "PONG");

  json doc = json::parse(engine.handleCommand(R"({"command":"PING"})"));
  EXPECT_EQ(doc.at("response"), "PONG");
}

// -----------------------------------------------------------------------------
// 3. An accepted order is PENDING until its fill is due, then EXECUTED and
//    visible in ORDER_HISTORY.
// -----------------------------------------------------------------------------
TEST_F(WealthEngineTest, SubmitOrderFillsAfterDelay) {
  int executed_events = 0;
  auto sub = engine.eventBus().subscribe<folio::OrderExecutedEvent>(
      [&executed_events](const folio::OrderExecutedEvent&) {
        ++executed_events;
      });

  json reply = engine.executeCommand(submitBody("ins-2", 10));
  ASSERT_EQ(reply.at("status"), "ok") << reply.dump();
  EXPECT_FALSE(reply.at("duplicate").get<bool>());
  const auto order_id = reply.at("order_id").get<folio::domain::OrderId>();

  auto pending = engine.findOrder(order_id);
  ASSERT_TRUE(pending.has_value());
  EXPECT_EQ(pending->status, folio::domain::OrderStatus::Pending);

  clock.advance_by(engine.limits().fill_delay_ms - 1);
  EXPECT_EQ(engine.runDueFills(), 0u);

  clock.advance_by(1);
  EXPECT_EQ(engine.runDueFills(), 1u);
  EXPECT_EQ(executed_events, 1);

  json history = engine.executeCommand(
      json{{"command", "ORDER_HISTORY"}, {"portfolio_id", "port-1"}});
  ASSERT_EQ(history.at("orders").size(), 1u);
  EXPECT_EQ(history.at("orders")[0].at("status"), "EXECUTED");
  EXPECT_DOUBLE_EQ(history.at("orders")[0].at("executed_price").get<double>(),
                   50.0);

  auto portfolio = engine.getPortfolio("port-1");
  ASSERT_TRUE(portfolio.has_value());
  EXPECT_DOUBLE_EQ(portfolio->portfolio.cash, 4500.0);
  EXPECT_EQ(engine.transactions().size(), 1u);

  engine.eventBus().unsubscribe(sub);
}

// -----------------------------------------------------------------------------
// 4. A rejected order reports its code and reason and creates nothing.
// Why: 10 more VTI would take the position to 4,000 of 10,000 (40%), above
//      the default 25% limit.
// -----------------------------------------------------------------------------
TEST_F(WealthEngineTest, SubmitOrderRejected) {
  json reply = engine.executeCommand(submitBody("ins-1", 10));
  EXPECT_EQ(reply.at("status"), "rejected");
  EXPECT_EQ(reply.at("code"), "CONCENTRATION_EXCEEDED");
  EXPECT_EQ(reply.at("reason"),
            "Position would be 40.00% of portfolio (limit 25.00%)");

  EXPECT_TRUE(engine.getOrderHistory("port-1").empty());
}

// -----------------------------------------------------------------------------
// 5. ALLOCATIONS lists non-empty buckets in reporting order.
// -----------------------------------------------------------------------------
TEST_F(WealthEngineTest, Allocations) {
  json reply = engine.executeCommand(
      json{{"command", "ALLOCATIONS"}, {"portfolio_id", "port-1"}});
  ASSERT_EQ(reply.at("status"), "ok");

  const json& entries = reply.at("allocations");
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].at("asset_class"), "EQUITY");
  EXPECT_DOUBLE_EQ(entries[0].at("percentage").get<double>(), 30.0);
  EXPECT_EQ(entries[1].at("asset_class"), "FIXED_INCOME");
  EXPECT_DOUBLE_EQ(entries[1].at("percentage").get<double>(), 20.0);
  EXPECT_EQ(entries[2].at("asset_class"), "CASH");
  EXPECT_DOUBLE_EQ(entries[2].at("value").get<double>(), 5000.0);
}

// -----------------------------------------------------------------------------
// 6. DRIFT defaults to the owner's risk score; an explicit score overrides.
// -----------------------------------------------------------------------------
TEST_F(WealthEngineTest, Drift) {
  // Balanced 60/30/5/5 vs 30/20/50/0: (30 + 10 + 45 + 5) / 2 = 45.
  json reply = engine.executeCommand(
      json{{"command", "DRIFT"}, {"portfolio_id", "port-1"}});
  ASSERT_EQ(reply.at("status"), "ok") << reply.dump();
  EXPECT_EQ(reply.at("drift").at("model_name"), "Balanced");
  EXPECT_NEAR(reply.at("drift").at("drift_percentage").get<double>(), 45.0,
              1e-9);

  // Conservative 20/65/10/5: (10 + 45 + 40 + 5) / 2 = 50.
  json conservative = engine.executeCommand(json{
      {"command", "DRIFT"}, {"portfolio_id", "port-1"}, {"risk_score", 2}});
  EXPECT_EQ(conservative.at("drift").at("model_id"), "mp-1");
  EXPECT_NEAR(conservative.at("drift").at("drift_percentage").get<double>(),
              50.0, 1e-9);

  // port-9's owner has no profile and no score was given.
  json no_score = engine.executeCommand(
      json{{"command", "DRIFT"}, {"portfolio_id", "port-9"}});
  EXPECT_EQ(no_score.at("status"), "error");
}

// -----------------------------------------------------------------------------
// 7. RECOMMENDATIONS: large drift and idle cash, nothing else.
// -----------------------------------------------------------------------------
TEST_F(WealthEngineTest, Recommendations) {
  json reply = engine.executeCommand(
      json{{"command", "RECOMMENDATIONS"}, {"portfolio_id", "port-1"}});
  ASSERT_EQ(reply.at("status"), "ok");

  const json& recs = reply.at("recommendations");
  ASSERT_EQ(recs.size(), 2u) << recs.dump();
  EXPECT_EQ(recs[0].at("type"), "REBALANCE_PORTFOLIO");
  EXPECT_EQ(recs[0].at("priority"), "HIGH");
  EXPECT_EQ(recs[1].at("type"), "INVEST_CASH");
  EXPECT_EQ(recs[1].at("priority"), "MEDIUM");
  EXPECT_EQ(recs[1].at("description"),
            "50.0% of your portfolio is held in cash.");
}

// -----------------------------------------------------------------------------
// 8. PORTFOLIO returns the valued snapshot.
// -----------------------------------------------------------------------------
TEST_F(WealthEngineTest, PortfolioCommand) {
  json reply = engine.executeCommand(
      json{{"command", "PORTFOLIO"}, {"portfolio_id", "port-1"}});
  ASSERT_EQ(reply.at("status"), "ok");

  const json& portfolio = reply.at("portfolio");
  EXPECT_EQ(portfolio.at("client_id"), "cli-1");
  EXPECT_DOUBLE_EQ(portfolio.at("total_value").get<double>(), 10000.0);
  ASSERT_EQ(portfolio.at("holdings").size(), 2u);
  EXPECT_TRUE(portfolio.at("unpriced_holdings").empty());
}

// -----------------------------------------------------------------------------
// 9. Bad input never throws; it comes back as status "error".
// -----------------------------------------------------------------------------
TEST_F(WealthEngineTest, MalformedCommands) {
  auto expectError = [this](const json& request) {
    json reply = engine.executeCommand(request);
    EXPECT_EQ(reply.at("status"), "error") << request.dump();
    EXPECT_TRUE(reply.at("response").is_string());
  };

  expectError(json{{"command", "LAUNCH"}});
  expectError(json::array({1, 2}));
  expectError(json{{"command", 42}});
  expectError(json{{"command", "ALLOCATIONS"}});
  expectError(json{{"command", "ALLOCATIONS"}, {"portfolio_id", "port-404"}});
  expectError(json{{"command", "PORTFOLIO"}, {"portfolio_id", 7}});

  json missing_side = submitBody("ins-2", 1);
  missing_side.erase("side");
  expectError(missing_side);

  json bad_quantity = submitBody("ins-2", 1);
  bad_quantity["quantity"] = "lots";
  expectError(bad_quantity);

  json unknown = json::parse(engine.handleCommand("{not json"));
  EXPECT_EQ(unknown.at("status"), "error");
}

// -----------------------------------------------------------------------------
// 10. Resubmitting with the same idempotency key returns the same order.
// -----------------------------------------------------------------------------
TEST_F(WealthEngineTest, DuplicateSubmission) {
  json body = submitBody("ins-2", 2);
  body["idempotency_key"] = "rebalance-2024-01";

  json first = engine.executeCommand(body);
  json second = engine.executeCommand(body);
  ASSERT_EQ(first.at("status"), "ok");
  ASSERT_EQ(second.at("status"), "ok");
  EXPECT_EQ(first.at("order_id"), second.at("order_id"));
  EXPECT_TRUE(second.at("duplicate").get<bool>());

  settle();
  EXPECT_EQ(engine.getOrderHistory("port-1").size(), 1u);
}

// -----------------------------------------------------------------------------
// 11. start()/stop() without IPC endpoints; stop() leaves unfilled orders
//     PENDING.
// -----------------------------------------------------------------------------
TEST_F(WealthEngineTest, StartStopWithoutIpc) {
  engine.start();
  EXPECT_TRUE(engine.running());
  engine.start();

  json reply = engine.executeCommand(submitBody("ins-2", 1));
  ASSERT_EQ(reply.at("status"), "ok");

  engine.stop();
  EXPECT_FALSE(engine.running());
  engine.stop();

  auto order = engine.findOrder(reply.at("order_id").get<folio::domain::OrderId>());
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->status, folio::domain::OrderStatus::Pending);
}

// -----------------------------------------------------------------------------
// 12. Stopping while fills and telemetry are in flight.
// Runs with the fill worker and an in-process IPC server, so the fill thread
// publishes through the telemetry bridge while stop() tears the server down.
// Every order ends either EXECUTED or still PENDING, and cash matches the
// executed ones.
// -----------------------------------------------------------------------------
TEST(WealthEngineShutdownTest, StopWhileFillsInFlight) {
  json config = engineConfig();
  config["limits"]["fill_delay_ms"] = 1;
  config["ipc"]["command_endpoint"] = "inproc://folio-shutdown-cmd";
  config["ipc"]["telemetry_endpoint"] = "inproc://folio-shutdown-pub";

  folio::LiveTimeProvider clock;
  folio::WealthEngine engine(clock, folio::parseEngineConfig(config),
                             folio::FillMode::Worker);
  engine.start();
  ASSERT_TRUE(engine.running());

  std::vector<folio::domain::OrderId> ids;
  for (int i = 0; i < 8; ++i) {
    auto result = engine.submitOrder([] {
      folio::domain::OrderRequest r;
      r.portfolio_id = "port-1";
      r.instrument_id = "ins-2";
      r.side = folio::domain::Side::Buy;
      r.quantity = 1;
      return r;
    }());
    ASSERT_TRUE(result.accepted) << result.reason;
    ids.push_back(result.order_id);
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(2));

  engine.stop();
  EXPECT_FALSE(engine.running());

  int executed = 0;
  for (auto id : ids) {
    auto order = engine.findOrder(id);
    ASSERT_TRUE(order.has_value());
    if (order->status == folio::domain::OrderStatus::Executed) {
      ++executed;
    } else {
      EXPECT_EQ(order->status, folio::domain::OrderStatus::Pending);
    }
  }
  EXPECT_DOUBLE_EQ(engine.getPortfolio("port-1")->portfolio.cash,
                   5000.0 - 50.0 * executed);
}
