#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using vaultsync::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Shutdown() {
  vaultsync::observability::ShutdownLogging();
  vaultsync::observability::ShutdownMetrics();
  vaultsync::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: vaultsyncd <config.yaml> OR vaultsyncd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = vaultsync::config::ConfigLoader::LoadFromYaml(config_path);

    const vaultsync::observability::ServiceInfo service{.name = "vaultsyncd", .vault_id = config.device().vault_id()};
    vaultsync::observability::InitializeTracing(config.observability(), service);
    vaultsync::observability::InitializeMetrics(config.observability(), service);
    vaultsync::observability::InitializeLogging(config.logging(), service.name);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = vaultsync::factory::Build(config);

    // ------------------------------------------------------------
    // Start servers
    // ------------------------------------------------------------
    std::unique_ptr<Server> peer_server;
    if (!app.peer_services.empty()) {
      peer_server = std::make_unique<Server>(config.transport().direct().bind_address(), std::move(app.peer_services));
    }
    Server admin_server(config.server().admin_bind_address(), std::move(app.admin_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    if (peer_server) peer_server->Start();
    admin_server.Start();
    app.worker->Start();
    VAULTSYNC_LOG_INFO("vaultsyncd started", {vaultsync::observability::StringField("device_id", app.coordinator->device_id()),
                                              vaultsync::observability::StringField("admin_address", config.server().admin_bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    VAULTSYNC_LOG_INFO("shutting down vaultsyncd");

    app.worker->Stop();
    admin_server.Stop();
    if (peer_server) peer_server->Stop();
    Shutdown();
  } catch (const std::exception& e) {
    VAULTSYNC_LOG_ERROR("fatal error", {vaultsync::observability::StringField("error", e.what())});
    Shutdown();
    return 2;
  }

  return 0;
}
