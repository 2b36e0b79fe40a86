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

using strands::factory::Build;
using strands::runtime::Server;

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
    std::cerr << "Usage: strands-settlement <config.yaml> OR strands-settlement --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = strands::config::ConfigLoader::LoadFromYaml(config_path);

    strands::observability::InitializeTracing(config);
    strands::observability::InitializeMetrics(config);
    strands::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    STRANDS_LOG_INFO("Settlement service started", {strands::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    STRANDS_LOG_INFO("Shutting down settlement service");

    server.Stop();
    if (app.sweep_worker) {
      app.sweep_worker->Stop();
    }
    strands::observability::ShutdownLogging();
    strands::observability::ShutdownMetrics();
    strands::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    STRANDS_LOG_ERROR("Fatal error", {strands::observability::StringField("error", e.what())});
    strands::observability::ShutdownLogging();
    strands::observability::ShutdownMetrics();
    strands::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
