#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/admin_service.hpp"
#include "vaultsync/services/v1/admin_service.grpc.pb.h"

namespace vaultsync::grpc {

class AdminServer final : public vaultsync::services::v1::VaultAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<vaultsync::service::AdminService> svc);

  ::grpc::Status Pair(::grpc::ServerContext*, const vaultsync::services::v1::PairRequest*, vaultsync::services::v1::PairResponse*) override;

  ::grpc::Status Revoke(::grpc::ServerContext*, const vaultsync::services::v1::RevokeRequest*, vaultsync::services::v1::RevokeResponse*) override;

  ::grpc::Status TriggerSync(::grpc::ServerContext*, const vaultsync::services::v1::TriggerSyncRequest*,
                             vaultsync::services::v1::TriggerSyncResponse*) override;

  ::grpc::Status Status(::grpc::ServerContext*, const vaultsync::services::v1::StatusRequest*, vaultsync::services::v1::StatusResponse*) override;

  ::grpc::Status Append(::grpc::ServerContext*, const vaultsync::services::v1::AppendRequest*, vaultsync::services::v1::AppendResponse*) override;

  ::grpc::Status DeleteEntity(::grpc::ServerContext*, const vaultsync::services::v1::DeleteEntityRequest*,
                              vaultsync::services::v1::AppendResponse*) override;

  ::grpc::Status Snapshot(::grpc::ServerContext*, const vaultsync::services::v1::SnapshotRequest*,
                          vaultsync::services::v1::SnapshotResponse*) override;

  ::grpc::Status GetDeviceToken(::grpc::ServerContext*, const vaultsync::services::v1::DeviceTokenRequest*,
                                vaultsync::core::v1::DeviceToken*) override;

 private:
  std::shared_ptr<vaultsync::service::AdminService> service_;
};

} // namespace vaultsync::grpc
