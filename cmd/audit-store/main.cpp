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

using audit::runtime::Server;

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
    std::cerr << "Usage: audit-store <config.yaml> OR audit-store --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = audit::config::ConfigLoader::LoadFromYaml(config_path);

    audit::observability::InitializeTracing(config);
    audit::observability::InitializeMetrics(config);
    audit::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = audit::factory::Build(config);

    // ------------------------------------------------------------
    // Start server and workers
    // ------------------------------------------------------------
    Server server(audit::runtime::ServerOptions::FromConfig(config.server()), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    for (auto& worker : app.background_workers) worker->Start();

    AUDIT_LOG_INFO("Audit store started", {audit::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    AUDIT_LOG_INFO("Shutting down audit store");

    // Stop intake first so the DLQ drain sees a stable queue.
    server.Stop();
    for (auto it = app.background_workers.rbegin(); it != app.background_workers.rend(); ++it) (*it)->Stop();

    audit::observability::ShutdownLogging();
    audit::observability::ShutdownMetrics();
    audit::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    AUDIT_LOG_ERROR("Fatal error", {audit::observability::StringField("error", e.what())});
    audit::observability::ShutdownLogging();
    audit::observability::ShutdownMetrics();
    audit::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
