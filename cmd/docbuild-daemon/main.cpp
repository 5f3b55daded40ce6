#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#if DOCBUILD_ENABLE_GRPC
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/query_server.hpp"
#include "internal/runtime/server.hpp"
#endif

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
    std::cerr << "Usage: docbuild-daemon <config.yaml> OR docbuild-daemon --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = docbuild::config::ConfigLoader::LoadFromYaml(config_path);

    docbuild::observability::InitializeTracing(config);
    docbuild::observability::InitializeMetrics(config);
    docbuild::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = docbuild::factory::Build(config);

    // Register signal handlers before starting threads to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

#if DOCBUILD_ENABLE_GRPC
    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<docbuild::grpc::AdminServer>(app.admin_service));
    services.push_back(std::make_unique<docbuild::grpc::QueryServer>(app.query_service));
    docbuild::runtime::ServerOptions server_options;
    server_options.bind_address      = config.server().bind_address();
    server_options.max_message_bytes = config.server().max_message_bytes();
    docbuild::runtime::Server server(std::move(server_options), std::move(services));
    server.Start();
#endif

    app.orchestrator->Start();
    DOCBUILD_LOG_INFO("docbuild daemon started", {docbuild::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    DOCBUILD_LOG_INFO("Shutting down docbuild daemon");

#if DOCBUILD_ENABLE_GRPC
    server.Stop();
#endif
    app.orchestrator->Stop();
    docbuild::observability::ShutdownLogging();
    docbuild::observability::ShutdownMetrics();
    docbuild::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    DOCBUILD_LOG_ERROR("Fatal error", {docbuild::observability::StringField("error", e.what())});
    docbuild::observability::ShutdownLogging();
    docbuild::observability::ShutdownMetrics();
    docbuild::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
