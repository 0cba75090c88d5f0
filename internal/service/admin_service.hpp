#pragma once

#include "service_context.hpp"
#include "vaultsync/services/v1/admin_service.pb.h"

namespace vaultsync::service {

/*
  Local control plane behind VaultAdminService.

  Converts between protobuf requests and coordinator calls; exceptions
  propagate to the gRPC adapter.
*/
class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  vaultsync::services::v1::PairResponse Pair(const vaultsync::services::v1::PairRequest& req);
  vaultsync::services::v1::RevokeResponse Revoke(const vaultsync::services::v1::RevokeRequest& req);
  vaultsync::services::v1::TriggerSyncResponse TriggerSync(const vaultsync::services::v1::TriggerSyncRequest& req);
  vaultsync::services::v1::StatusResponse Status(const vaultsync::services::v1::StatusRequest& req);
  vaultsync::services::v1::AppendResponse Append(const vaultsync::services::v1::AppendRequest& req);
  vaultsync::services::v1::AppendResponse DeleteEntity(const vaultsync::services::v1::DeleteEntityRequest& req);
  vaultsync::services::v1::SnapshotResponse Snapshot(const vaultsync::services::v1::SnapshotRequest& req);
  vaultsync::core::v1::DeviceToken GetDeviceToken(const vaultsync::services::v1::DeviceTokenRequest& req);

 private:
  template <typename Fn>
  auto Observe(const char* route, Fn&& fn) -> decltype(fn());

  ServiceContext ctx_;
};

} // namespace vaultsync::service
