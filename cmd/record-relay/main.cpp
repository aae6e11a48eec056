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

using recsync::runtime::Server;

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
    std::cerr << "Usage: record-relay <config.yaml> OR record-relay --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = recsync::config::ConfigLoader::LoadFromYaml(config_path);

    recsync::observability::InitializeLogging(config);
    recsync::observability::InitializeTracing(config);
    recsync::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), recsync::factory::BuildRelayServices(config));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    RECSYNC_LOG_INFO("record relay started", {recsync::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    RECSYNC_LOG_INFO("shutting down record relay");

    server.Stop();
    recsync::observability::ShutdownLogging();
    recsync::observability::ShutdownMetrics();
    recsync::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    RECSYNC_LOG_ERROR("fatal error", {recsync::observability::StringField("error", e.what())});
    recsync::observability::ShutdownLogging();
    recsync::observability::ShutdownMetrics();
    recsync::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
