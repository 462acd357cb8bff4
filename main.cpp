// -----------------------------------------------------------------------------
// tokensale_node — single executable entry point.
//
//   1) Load the JSON configuration named on the command line.
//   2) Pick the clock: wall clock, or a simulation clock pinned to the
//      configured start time.
//   3) Create the SaleEngine, build the simulated ledger (tokens, native
//      balances, price feeds) into its contract directory.
//   4) Subscribe a console logger to every committed notification.
//   5) Start the engine; the IPC server answers commands on the REP socket
//      and broadcasts notifications on the PUB socket.
//   6) Wait for Ctrl-C, then shut down cleanly.
//
// Thread layout:
//   main thread   → waits for SIGINT
//   ipc thread    → IpcServer (commands run SaleEngine operations here)
// -----------------------------------------------------------------------------

#include "tokensale/codec/json_codec.hpp"
#include "tokensale/config/engine_config.hpp"
#include "tokensale/engine/sale_engine.hpp"
#include "tokensale/time/live_time_provider.hpp"
#include "tokensale/time/simulation_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag for the signal handler. The only global in the program; the
// handler performs a single lock-free atomic store.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : "tokensale.json";

  // ---  1) Configuration ------------------------------------------------------
  tokensale::EngineConfig config;
  try {
    config = tokensale::loadConfig(config_path);
  } catch (const tokensale::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return 1;
  }

  // ---  2) Clock ---------------------------------------------------------------
  std::unique_ptr<tokensale::ITimeProvider> clock;
  if (config.simulation_start) {
    clock = std::make_unique<tokensale::SimulationTimeProvider>(
        *config.simulation_start);
    std::cout << "[main] simulation clock at " << *config.simulation_start
              << "\n";
  } else {
    clock = std::make_unique<tokensale::LiveTimeProvider>();
  }

  // ---  3) Engine + simulated ledger ------------------------------------------
  std::unique_ptr<tokensale::SaleEngine> engine;
  try {
    engine = std::make_unique<tokensale::SaleEngine>(config, *clock);
    tokensale::buildSimulatedLedger(config, engine->directory());
  } catch (const tokensale::SaleError& e) {
    std::cerr << "[main] cannot build engine: " << e.what() << "\n";
    return 1;
  }

  // ---  4) Console logger -----------------------------------------------------
  engine->eventBus().subscribe([](const tokensale::Event& e) {
    std::cout << "[Notification] " << tokensale::codec::toJson(e).dump()
              << "\n";
  });

  // ---  5) Start --------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);
  std::signal(SIGTERM, sigint_handler);

  try {
    engine->start();
  } catch (const std::exception& e) {
    std::cerr << "[main] cannot start engine: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[main] command socket " << config.command_endpoint
            << ", notifications on " << config.publish_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  // ---  6) Wait for shutdown --------------------------------------------------
  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] shutdown requested. Stopping engine...\n";
  engine->stop();

  return 0;
}
