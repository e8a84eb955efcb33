// -----------------------------------------------------------------------------
// riskcore_server — risk gate as a ZeroMQ service.
//
// Usage: riskcore_server [config.json] [starting_equity]
//
//   1) Load the RiskContextConfig (defaults if no path is given).
//   2) Create the wall clock and the RiskContext.
//   3) Wire RiskCommandHandler to an IpcServer: commands arrive on the REP
//      socket, assessment telemetry leaves on the PUB socket.
//   4) Idle on the main thread until SIGINT/SIGTERM, then shut down.
//
// Thread layout:
//   main thread  → waits for the shutdown flag
//   IPC thread   → IpcServer::run(), RiskCommandHandler::execute()
//
// A configuration or startup failure exits non-zero before any socket is
// bound; the gate never serves with a half-valid config.
// -----------------------------------------------------------------------------

#include "riskcore/config/config_loader.hpp"
#include "riskcore/engine/risk_command_handler.hpp"
#include "riskcore/engine/risk_context.hpp"
#include "riskcore/network/ipc_server.hpp"
#include "riskcore/time/live_time_provider.hpp"

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

// Set from the signal handler; polled by main().
volatile std::sig_atomic_t g_shutdown_requested = 0;

void shutdown_handler(int /*signum*/) { g_shutdown_requested = 1; }

constexpr double kDefaultEquity = 100'000.0;

}  // namespace

int main(int argc, char* argv[]) {
  try {
    // -----------------------------------------------------------------------
    // 1) Configuration
    // -----------------------------------------------------------------------
    riskcore::domain::RiskContextConfig config;
    if (argc > 1) {
      config = riskcore::load_config(argv[1]);
    } else {
      std::cout << "[main] no config path given, using defaults\n";
    }

    double equity = kDefaultEquity;
    if (argc > 2) {
      equity = std::stod(argv[2]);
    }

    // -----------------------------------------------------------------------
    // 2) Clock and risk gate
    // -----------------------------------------------------------------------
    riskcore::LiveTimeProvider clock;
    riskcore::RiskContext context(clock, config, equity);
    std::cout << "[main] RiskContext ready. equity=" << context.equity()
              << " default_regime=" << config.default_regime << "\n";

    // -----------------------------------------------------------------------
    // 3) Command handler ↔ IPC server
    // The sink runs inside execute() on the IPC thread and only enqueues;
    // the server publishes on its next loop iteration.
    // -----------------------------------------------------------------------
    std::unique_ptr<riskcore::IpcServer> server;
    riskcore::RiskCommandHandler handler(
        context, [&server](const std::string& telemetry) {
          if (server) {
            server->pushTelemetry(telemetry);
          }
        });

    server = std::make_unique<riskcore::IpcServer>(
        [&handler](const std::string& cmd) { return handler.execute(cmd); });

    std::signal(SIGINT, shutdown_handler);
    std::signal(SIGTERM, shutdown_handler);

    server->start();

    // -----------------------------------------------------------------------
    // 4) Idle until asked to stop
    // -----------------------------------------------------------------------
    while (g_shutdown_requested == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[main] shutdown requested.\n";
    server->stop();
  } catch (const riskcore::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[main] fatal: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[main] done.\n";
  return 0;
}
