// -----------------------------------------------------------------------------
// gold_custody: single executable entry point.
//
//   1) Load EngineConfig from argv[1] (default config/engine.json).
//   2) Build the CustodyEngine on a LiveTimeProvider. The registry is seeded
//      from the config; ledger, custody and settlement start empty.
//   3) Subscribe logging callbacks for the settlement lifecycle.
//   4) start(): brings up the IPC server (PUB telemetry + REP queries) when
//      both endpoints are configured.
//   5) Wait for Ctrl-C, then stop and optionally dump the audit log as JSON
//      lines to argv[2].
//
// Thread layout:
//   main thread   → waits on the shutdown flag
//   ipc thread    → IpcServer poll/drain loop (queries + telemetry)
// -----------------------------------------------------------------------------

#include "gold/engine/custody_engine.hpp"
#include "gold/errors/ledger_error.hpp"
#include "gold/events/event_types.hpp"
#include "gold/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

// Set by the SIGINT handler, polled by main(). The only global in the
// program.
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : "config/engine.json";

  gold::EngineConfig config;
  try {
    config = gold::loadEngineConfig(config_path);
  } catch (const gold::LedgerError& e) {
    std::cerr << "[main] cannot start: " << e.what() << "\n";
    return 1;
  }

  gold::LiveTimeProvider clock;
  gold::CustodyEngine engine(std::move(config), clock);

  engine.eventBus().subscribe<gold::OrderExecutedEvent>(
      [](const gold::OrderExecutedEvent& e) {
        std::cout << "[Settlement] executed tx_ref=" << e.tx_ref
                  << " quantity=" << e.quantity
                  << " tokens_moved=" << e.tokens_moved
                  << " ledger_updated=" << e.ledger_updated << "\n";
      });

  engine.eventBus().subscribe<gold::OrderCancelledEvent>(
      [](const gold::OrderCancelledEvent& e) {
        std::cout << "[Settlement] cancelled tx_ref=" << e.tx_ref
                  << " reason=" << e.reason << "\n";
      });

  try {
    engine.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] cannot open IPC endpoints: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, sigint_handler);
  std::cout << "[main] Press Ctrl-C to shut down.\n";

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  engine.stop();

  if (argc > 2) {
    std::ofstream out(argv[2]);
    if (!out) {
      std::cerr << "[main] cannot write audit log to " << argv[2] << "\n";
      return 1;
    }
    engine.eventLog().writeJsonLines(out);
    std::cout << "[main] wrote " << engine.eventLog().size()
              << " audit event(s) to " << argv[2] << "\n";
  }

  return 0;
}
