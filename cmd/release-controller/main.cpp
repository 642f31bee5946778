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
#include "internal/runtime/stop_signal.hpp"

using releasectl::factory::Build;
using releasectl::runtime::Server;

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
    std::cerr << "Usage: release-controller <config.yaml> OR release-controller --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = releasectl::config::ConfigLoader::LoadFromYaml(config_path);

    releasectl::observability::InitializeTracing(config);
    releasectl::observability::InitializeMetrics(config);
    releasectl::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // Register signal handlers before anything starts to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    // ------------------------------------------------------------
    // Start release source, cache and controller
    // ------------------------------------------------------------
    if (app.source) app.source->Start();
    app.informer->Start();

    releasectl::runtime::StopSignal stop;
    std::thread                     controller_thread([&] { app.controller->Run(stop); });

    // ------------------------------------------------------------
    // Start admin server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));
    try {
      server.Start();
    } catch (...) {
      stop.Stop();
      controller_thread.join();
      throw;
    }
    RELEASECTL_LOG_INFO("Release controller started", {releasectl::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    RELEASECTL_LOG_INFO("Shutting down release controller");

    if (app.source) app.source->Stop();
    stop.Stop();
    controller_thread.join();
    server.Stop();
    app.informer->Stop();

    releasectl::observability::ShutdownLogging();
    releasectl::observability::ShutdownMetrics();
    releasectl::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    RELEASECTL_LOG_ERROR("Fatal error", {releasectl::observability::StringField("error", e.what())});
    releasectl::observability::ShutdownLogging();
    releasectl::observability::ShutdownMetrics();
    releasectl::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
