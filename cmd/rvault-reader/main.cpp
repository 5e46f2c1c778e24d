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

using rvault::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

void ShutdownObservability() {
  rvault::observability::ShutdownLogging();
  rvault::observability::ShutdownMetrics();
  rvault::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: rvault-reader <config.yaml> OR rvault-reader --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = rvault::config::ConfigLoader::LoadFromYaml(config_path);

    rvault::observability::InitializeTracing(config);
    rvault::observability::InitializeMetrics(config);
    rvault::observability::InitializeLogging(config);

    auto app = rvault::factory::Build(config);

    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    RVAULT_LOG_INFO("rvault-reader started",
                    {rvault::observability::StringField("bind_address", config.server().bind_address()),
                     rvault::observability::IntField("port", server.listening_port())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    RVAULT_LOG_INFO("Shutting down rvault-reader");

    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    RVAULT_LOG_ERROR("Fatal error", {rvault::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
