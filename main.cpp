// -----------------------------------------------------------------------------
// folio_server — single executable entry point.
//
//   1) Load the engine configuration (argv[1], default config/engine.json).
//   2) Create the WealthEngine on the live clock. Construction seeds the
//      instrument catalog, the risk profiles, and the portfolios.
//   3) Subscribe logging callbacks for order lifecycle and holding events.
//   4) Start the engine: fill worker plus the ZeroMQ command and telemetry
//      sockets.
//   5) Idle on the main thread until Ctrl-C, then shut down cleanly.
//
// Thread layout:
//   main thread   → waits for SIGINT
//   fill worker   → executes accepted orders once their fill delay elapses
//   IPC thread    → REP command socket + PUB telemetry socket
// -----------------------------------------------------------------------------

#include "folio/config/engine_config.hpp"
#include "folio/domain/order.hpp"
#include "folio/domain/order_status.hpp"
#include "folio/engine/wealth_engine.hpp"
#include "folio/events/holding_update_event.hpp"
#include "folio/events/order_lifecycle_events.hpp"
#include "folio/time/live_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace {

// Set by the SIGINT handler; polled by the main loop. A lock-free atomic
// store is async-signal-safe.
std::atomic<bool> g_shutdown_requested{false};

void sigint_handler(int /*signum*/) { g_shutdown_requested.store(true); }

void installEventLogging(folio::EventBus& bus) {
  bus.subscribe<folio::OrderCreatedEvent>(
      [](const folio::OrderCreatedEvent& e) {
        std::cout << "[OrderCreated] order_id=" << e.order.id
                  << " portfolio=" << e.order.portfolio_id
                  << " symbol=" << e.symbol
                  << " side=" << folio::domain::sideToString(e.order.side)
                  << " qty=" << e.order.quantity << "\n";
      });

  bus.subscribe<folio::OrderExecutedEvent>(
      [](const folio::OrderExecutedEvent& e) {
        std::cout << "[OrderExecuted] order_id=" << e.order.id
                  << " symbol=" << e.symbol
                  << " qty=" << e.transaction.quantity
                  << " price=" << e.transaction.price
                  << " amount=" << e.transaction.amount << "\n";
      });

  bus.subscribe<folio::OrderFailedEvent>(
      [](const folio::OrderFailedEvent& e) {
        std::cout << "[OrderFailed] order_id=" << e.order.id << " reason="
                  << e.order.failure_reason.value_or("unknown") << "\n";
      });

  bus.subscribe<folio::HoldingUpdateEvent>(
      [](const folio::HoldingUpdateEvent& e) {
        std::cout << "[HoldingUpdate] portfolio=" << e.holding.portfolio_id
                  << " instrument=" << e.holding.instrument_id
                  << " qty=" << e.holding.quantity
                  << " avg_cost=" << e.holding.average_cost
                  << (e.removed ? " (closed)" : "")
                  << " cash_after=" << e.cash_after << "\n";
      });
}

}  // namespace

int main(int argc, char* argv[]) {
  const std::string config_path = argc > 1 ? argv[1] : "config/engine.json";

  // -------------------------------------------------------------------------
  // 1) Configuration. A bad file is fatal: nothing is started.
  // -------------------------------------------------------------------------
  folio::EngineConfig config;
  try {
    config = folio::loadEngineConfig(config_path);
  } catch (const folio::ConfigError& e) {
    std::cerr << "[main] Invalid configuration '" << config_path
              << "': " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Engine on the wall clock.
  // -------------------------------------------------------------------------
  folio::LiveTimeProvider clock;
  folio::WealthEngine engine(clock, config);

  installEventLogging(engine.eventBus());

  // -------------------------------------------------------------------------
  // 3) Start. A failed bind (port in use) surfaces as zmq::error_t.
  // -------------------------------------------------------------------------
  try {
    engine.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] Failed to start IPC server: " << e.what() << "\n";
    engine.stop();
    return 1;
  }

  std::signal(SIGINT, sigint_handler);

  std::cout << "[main] Commands on " << config.command_endpoint
            << ", telemetry on " << config.telemetry_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Stopping engine...\n";
  engine.stop();

  return 0;
}
