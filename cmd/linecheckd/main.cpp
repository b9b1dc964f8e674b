#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/broadcast/broadcast_hub.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using linecheck::runtime::Server;

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
    std::cerr << "Usage: linecheckd <config.yaml> OR linecheckd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = linecheck::config::ConfigLoader::LoadFromYaml(config_path);

    linecheck::observability::InitializeTracing(config);
    linecheck::observability::InitializeMetrics(config);
    linecheck::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = linecheck::factory::Build(config);
    auto hub = app.context.hub;

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    LINECHECK_LOG_INFO("linecheckd started", {linecheck::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    LINECHECK_LOG_INFO("Shutting down linecheckd");

    // no new streams once the server is down; the grace deadline cancels open ones
    server.Stop();
    hub->Shutdown();
    linecheck::observability::ShutdownLogging();
    linecheck::observability::ShutdownMetrics();
    linecheck::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    LINECHECK_LOG_ERROR("Fatal error", {linecheck::observability::StringField("error", e.what())});
    linecheck::observability::ShutdownLogging();
    linecheck::observability::ShutdownMetrics();
    linecheck::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
