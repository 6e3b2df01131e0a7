#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/runtime/server.hpp"

using releaselog::factory::Build;
using releaselog::runtime::Server;

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
    std::cerr << "Usage: release-log-streamer <config.yaml> OR release-log-streamer --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = releaselog::config::ConfigLoader::LoadFromYaml(config_path);

    releaselog::observability::InitializeMetrics(config);
    releaselog::observability::InitializeLogging(config);

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
    RELEASELOG_LOG_INFO("release log streamer started", {releaselog::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    RELEASELOG_LOG_INFO("Shutting down release log streamer");

    server.Stop(std::chrono::milliseconds(config.engine().shutdown_timeout_ms()));
    releaselog::observability::ShutdownLogging();
    releaselog::observability::ShutdownMetrics();
  } catch (const std::exception& e) {
    RELEASELOG_LOG_ERROR("Fatal error", {releaselog::observability::StringField("error", e.what())});
    releaselog::observability::ShutdownLogging();
    releaselog::observability::ShutdownMetrics();
    return 2;
  }

  return 0;
}
