#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace vaultsync::grpc {

using namespace vaultsync::services::v1;

AdminServer::AdminServer(std::shared_ptr<vaultsync::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Pair(::grpc::ServerContext*, const PairRequest* req, PairResponse* resp) {
  try {
    *resp = service_->Pair(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Revoke(::grpc::ServerContext*, const RevokeRequest* req, RevokeResponse* resp) {
  try {
    *resp = service_->Revoke(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::TriggerSync(::grpc::ServerContext*, const TriggerSyncRequest* req, TriggerSyncResponse* resp) {
  try {
    *resp = service_->TriggerSync(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Status(::grpc::ServerContext*, const StatusRequest* req, StatusResponse* resp) {
  try {
    *resp = service_->Status(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Append(::grpc::ServerContext*, const AppendRequest* req, AppendResponse* resp) {
  try {
    *resp = service_->Append(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::DeleteEntity(::grpc::ServerContext*, const DeleteEntityRequest* req, AppendResponse* resp) {
  try {
    *resp = service_->DeleteEntity(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Snapshot(::grpc::ServerContext*, const SnapshotRequest* req, SnapshotResponse* resp) {
  try {
    *resp = service_->Snapshot(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetDeviceToken(::grpc::ServerContext*, const DeviceTokenRequest* req, vaultsync::core::v1::DeviceToken* resp) {
  try {
    *resp = service_->GetDeviceToken(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace vaultsync::grpc
