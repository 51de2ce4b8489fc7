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

using forecast::factory::Build;
using forecast::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Shutdown() {
  forecast::observability::ShutdownLogging();
  forecast::observability::ShutdownMetrics();
  forecast::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: forecast-sync <config.yaml> OR forecast-sync --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = forecast::config::ConfigLoader::LoadFromYaml(config_path);

    forecast::observability::InitializeLogging(config);
    forecast::observability::InitializeTracing(config);
    forecast::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const std::string bind_address = config.server().bind_address().empty() ? "0.0.0.0:50051" : config.server().bind_address();
    Server            server(bind_address, std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    FORECAST_LOG_INFO("forecast-sync started", {forecast::observability::StringField("bind_address", bind_address),
                                                 forecast::observability::IntField("jobs", static_cast<int64_t>(app.scheduler->Jobs().size()))});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FORECAST_LOG_INFO("Shutting down forecast-sync");

    server.Stop();
    app.scheduler->StopAll();
    Shutdown();
  } catch (const std::exception& e) {
    FORECAST_LOG_ERROR("Fatal error", {forecast::observability::StringField("error", e.what())});
    Shutdown();
    return 2;
  }

  return 0;
}
