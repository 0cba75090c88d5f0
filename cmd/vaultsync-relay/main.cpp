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

using vaultsync::observability::IntField;
using vaultsync::observability::StringField;

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
    std::cerr << "Usage: vaultsync-relay <config.yaml> OR vaultsync-relay --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = vaultsync::config::ConfigLoader::LoadFromYaml(config_path);
    if (config.relay().bind_address().empty()) {
      std::cerr << "relay.bind_address must be set" << std::endl;
      return 1;
    }

    const vaultsync::observability::ServiceInfo service{.name = "vaultsync-relay"};
    vaultsync::observability::InitializeTracing(config.observability(), service);
    vaultsync::observability::InitializeMetrics(config.observability(), service);
    vaultsync::observability::InitializeLogging(config.logging(), service.name);

    auto app = vaultsync::factory::BuildRelay(config);

    vaultsync::runtime::Server server(config.relay().bind_address(), std::move(app.grpc_services));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    VAULTSYNC_LOG_INFO("relay started", {StringField("bind_address", config.relay().bind_address()),
                                         IntField("mailbox_capacity", config.relay().mailbox_capacity())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    VAULTSYNC_LOG_INFO("shutting down relay", {IntField("queued", static_cast<std::int64_t>(app.store->TotalQueued()))});

    server.Stop();
  } catch (const std::exception& e) {
    VAULTSYNC_LOG_ERROR("fatal error", {StringField("error", e.what())});
    vaultsync::observability::ShutdownLogging();
    vaultsync::observability::ShutdownMetrics();
    vaultsync::observability::ShutdownTracing();
    return 2;
  }

  vaultsync::observability::ShutdownLogging();
  vaultsync::observability::ShutdownMetrics();
  vaultsync::observability::ShutdownTracing();
  return 0;
}
