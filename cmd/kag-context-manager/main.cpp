#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/context_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using kag::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  kag::observability::ShutdownLogging();
  kag::observability::ShutdownMetrics();
  kag::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else if (argc != 1) {
    std::cerr << "Usage: kag-context-manager [<config.yaml> | --config <config.yaml>]" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? kag::config::ConfigLoader::LoadDefault() : kag::config::ConfigLoader::LoadFromYaml(config_path);

    kag::observability::InitializeTracing(config);
    kag::observability::InitializeMetrics(config);
    kag::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build runtime (dependency graph)
    // ------------------------------------------------------------
    auto runtime = kag::factory::Build(config);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<kag::grpc::ContextServer>(runtime.context_service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    KAG_LOG_INFO("kag-context-manager started", {kag::observability::StringField("bind_address", config.server().bind_address()),
                                                 kag::observability::StringField("config", config_path.empty() ? "<defaults>" : config_path)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    KAG_LOG_INFO("Shutting down kag-context-manager");

    server.Stop();
    runtime.Shutdown();
    ShutdownObservability();
  } catch (const std::exception& e) {
    KAG_LOG_ERROR("Fatal error", {kag::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
