#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/core/sync_coordinator.hpp"
#include "internal/relay/relay_store.hpp"
#include "internal/runtime/sync_worker.hpp"

namespace vaultsync::factory {

/*
  Application

  Owns all long-lived objects of the sync daemon. Everything here lives for
  the lifetime of the process.
*/
struct Application {
  std::shared_ptr<core::SyncCoordinator> coordinator;
  std::shared_ptr<runtime::SyncWorker>   worker;

  // Admin plane, bound to server.admin_bind_address.
  std::vector<std::unique_ptr<::grpc::Service>> admin_services;
  // Peer plane, bound to transport.direct.bind_address. Empty in relay mode.
  std::vector<std::unique_ptr<::grpc::Service>> peer_services;
};

struct RelayApplication {
  std::shared_ptr<relay::RelayStore>            store;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Composition root of the daemon. It is the only place that knows the
  concrete repository, key store and transport types.
*/
Application Build(const vaultsync::runtime::config::RuntimeConfig& config);

RelayApplication BuildRelay(const vaultsync::runtime::config::RuntimeConfig& config);

// Exposed for tests and tools that need a repository without the daemon.
std::shared_ptr<db::Repository> BuildRepository(const vaultsync::runtime::config::RuntimeConfig& config);

core::CoordinatorOptions CoordinatorOptionsFromConfig(const vaultsync::runtime::config::SyncConfig& sync);

} // namespace vaultsync::factory
