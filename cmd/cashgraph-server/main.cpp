#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/ledger_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using cashgraph::runtime::Server;

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
    std::cerr << "Usage: cashgraph-server <config.yaml> OR cashgraph-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = cashgraph::config::ConfigLoader::LoadFromYaml(config_path);

    cashgraph::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = cashgraph::factory::Build(config);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<cashgraph::grpc::LedgerServer>(app.ledger_service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const auto options = cashgraph::runtime::ServerOptions::FromProto(config.server());
    Server     server(options, std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    CASHGRAPH_LOG_INFO("cashgraph started", {cashgraph::observability::StringField("bind_address", options.bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    CASHGRAPH_LOG_INFO("shutting down cashgraph");

    server.Stop();
    cashgraph::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    CASHGRAPH_LOG_ERROR("fatal error", {cashgraph::observability::StringField("error", e.what())});
    cashgraph::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
