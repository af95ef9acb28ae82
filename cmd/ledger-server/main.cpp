#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using ledger::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  ledger::observability::ShutdownLogging();
  ledger::observability::ShutdownMetrics();
  ledger::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: ledger-server <config.yaml> OR ledger-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = ledger::config::ConfigLoader::LoadFromYaml(config_path);

    ledger::observability::InitializeTracing(config);
    ledger::observability::InitializeMetrics(config);
    ledger::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = ledger::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    LEDGER_LOG_INFO("Ledger server started", {ledger::observability::StringField("bind_address", config.server().bind_address()),
                                              ledger::observability::BoolField("scheduler", config.scheduler().enabled())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    LEDGER_LOG_INFO("Shutting down ledger server");

    for (const auto& worker : app.background_workers) {
      worker->Stop();
    }
    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    LEDGER_LOG_ERROR("Fatal error", {ledger::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
