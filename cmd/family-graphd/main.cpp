#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/family_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using famgraph::runtime::Server;

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
    std::cerr << "Usage: family-graphd <config.yaml> OR family-graphd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = famgraph::config::ConfigLoader::LoadFromYaml(config_path);

    famgraph::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = famgraph::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address());
    server.AddService(std::make_shared<famgraph::grpc::FamilyServer>(app.service));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    const int port = server.Start();
    FAMGRAPH_LOG_INFO("family-graphd started", {famgraph::observability::IntField("port", port),
                                                famgraph::observability::IntField("people", static_cast<std::int64_t>(app.restored.people_loaded))});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FAMGRAPH_LOG_INFO("Shutting down family-graphd");

    server.Shutdown();
    app.writer->Flush();
    app.writer->Stop();
    if (auto error = app.writer->LastError()) {
      FAMGRAPH_LOG_ERROR("Last snapshot write failed", {famgraph::observability::StringField("error", *error)});
    }
    famgraph::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    FAMGRAPH_LOG_ERROR("Fatal error", {famgraph::observability::StringField("error", e.what())});
    famgraph::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
