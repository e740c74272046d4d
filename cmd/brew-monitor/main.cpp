#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/monitor/cycle_ticker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using brewmon::factory::Build;
using brewmon::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: brew-monitor <config.yaml> OR brew-monitor --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = brewmon::config::ConfigLoader::LoadFromYaml(config_path);

    brewmon::observability::InitializeTracing(config);
    brewmon::observability::InitializeMetrics(config);
    brewmon::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server and cadence driver
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    app.ticker->Start();
    BREWMON_LOG_INFO("brew monitor started", {brewmon::observability::StringField("bind_address", config.server().bind_address()),
                                              brewmon::observability::BoolField("monitoring", config.monitor().start_enabled()),
                                              brewmon::observability::IntField("poll_interval_ms", config.monitor().poll_interval_ms())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    BREWMON_LOG_INFO("shutting down brew monitor");

    app.ticker->Stop();
    server.Stop();
    brewmon::observability::ShutdownLogging();
    brewmon::observability::ShutdownMetrics();
    brewmon::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    BREWMON_LOG_ERROR("Fatal error", {brewmon::observability::StringField("error", e.what())});
    brewmon::observability::ShutdownLogging();
    brewmon::observability::ShutdownMetrics();
    brewmon::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
