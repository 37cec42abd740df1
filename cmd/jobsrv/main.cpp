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

using jobsrv::factory::Build;
using jobsrv::runtime::Server;

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
    std::cerr << "Usage: jobsrv <config.yaml> OR jobsrv --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = jobsrv::config::ConfigLoader::LoadFromYaml(config_path);

    jobsrv::observability::InitializeTracing(config);
    jobsrv::observability::InitializeMetrics(config);
    jobsrv::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph, recovered state)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();
    server.Start();
    JOBSRV_LOG_INFO("jobsrv started", {jobsrv::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    JOBSRV_LOG_INFO("Shutting down jobsrv");

    server.Stop();
    app.Stop();
    jobsrv::observability::ShutdownLogging();
    jobsrv::observability::ShutdownMetrics();
    jobsrv::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    JOBSRV_LOG_ERROR("Fatal error", {jobsrv::observability::StringField("error", e.what())});
    jobsrv::observability::ShutdownLogging();
    jobsrv::observability::ShutdownMetrics();
    jobsrv::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
