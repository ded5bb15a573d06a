// -----------------------------------------------------------------------------
// arb_engine: single executable entry point.
//
// Paper-trading AMM arbitrage engine:
//   1) Load the JSON config (path from argv[1], default
//      config/arb_engine.json). An invalid config exits with status 1.
//   2) Pick the clock. --simulate uses a SimulationTimeProvider that the
//      reserve feed advances to each update's timestamp_ms (replays);
//      otherwise the wall clock.
//   3) Build the collaborators: fee oracle, confidence scorer (weights from
//      model_path when set) and trade store (JSON lines under store_dir, or
//      in memory).
//   4) Start the ArbitrageEngine: rehydrate risk state, scan loop, IPC
//      server, reserve feed.
//   5) Block until SIGINT/SIGTERM, then shut down cleanly.
//
// Thread layout:
//   main thread        -> waits for the shutdown signal
//   scan thread        -> ReserveBook, orchestrator, RiskController, executor
//   ipc thread         -> operator commands + telemetry
//   reserve feed       -> ZeroMQ SUB recv loop
// -----------------------------------------------------------------------------

#include "arb/accounting/i_fee_oracle.hpp"
#include "arb/config/engine_config.hpp"
#include "arb/engine/arbitrage_engine.hpp"
#include "arb/errors.hpp"
#include "arb/persistence/in_memory_trade_store.hpp"
#include "arb/persistence/jsonl_trade_store.hpp"
#include "arb/scoring/logistic_confidence_scorer.hpp"
#include "arb/time/live_time_provider.hpp"
#include "arb/time/simulation_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

// Set from the signal handler; polled by main().
std::atomic<bool> g_shutdown_requested{false};

void shutdown_handler(int /*signum*/) { g_shutdown_requested.store(true); }

void print_usage(const char* argv0) {
  std::cerr << "usage: " << argv0 << " [config.json] [--simulate]\n";
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path = "config/arb_engine.json";
  bool simulate = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--simulate") {
      simulate = true;
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else {
      config_path = arg;
    }
  }

  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  arb::EngineConfig config;
  try {
    config = arb::loadEngineConfig(config_path);
  } catch (const arb::InvalidConfiguration& e) {
    std::cerr << "[main] invalid configuration: " << e.what() << "\n";
    return 1;
  }
  std::cout << "[main] loaded " << config_path << "\n";

  // -------------------------------------------------------------------------
  // 2) Clock
  // -------------------------------------------------------------------------
  arb::LiveTimeProvider live_clock;
  arb::SimulationTimeProvider sim_clock;
  const arb::ITimeProvider& clock =
      simulate ? static_cast<const arb::ITimeProvider&>(sim_clock)
               : static_cast<const arb::ITimeProvider&>(live_clock);

  // -------------------------------------------------------------------------
  // 3) Collaborators
  // -------------------------------------------------------------------------
  arb::StaticFeeOracle fee_oracle;

  arb::LogisticConfidenceScorer scorer;
  if (!config.model_path.empty()) {
    scorer.loadFromFile(config.model_path);
  }

  std::unique_ptr<arb::ITradeStore> store;
  try {
    if (config.store_dir.empty()) {
      std::cout << "[main] no store_dir configured, trades kept in memory\n";
      store = std::make_unique<arb::InMemoryTradeStore>();
    } else {
      store = std::make_unique<arb::JsonlTradeStore>(config.store_dir);
    }
  } catch (const arb::PersistenceError& e) {
    std::cerr << "[main] cannot open trade store: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 4) Engine
  // -------------------------------------------------------------------------
  arb::ArbitrageEngine engine(config, clock, fee_oracle, scorer, *store,
                              nullptr, simulate ? &sim_clock : nullptr);
  try {
    engine.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] failed to start engine: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  std::cout << "[main] reserve feed: "
            << (config.endpoints.reserve_feed.empty()
                    ? std::string("(disabled)")
                    : config.endpoints.reserve_feed)
            << "\n[main] Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 5) Wait for shutdown
  // -------------------------------------------------------------------------
  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] shutdown requested. Stopping engine...\n";
  engine.stop();
  return 0;
}
