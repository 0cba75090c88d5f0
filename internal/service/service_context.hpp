#pragma once

#include <memory>

namespace vaultsync::core {
class SyncCoordinator;
}
namespace vaultsync::runtime {
class SyncWorker;
}

namespace vaultsync::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<vaultsync::core::SyncCoordinator> coordinator;
  // Optional; nudged after a manual trigger so replies are pumped promptly.
  std::shared_ptr<vaultsync::runtime::SyncWorker> worker;
};

} // namespace vaultsync::service
