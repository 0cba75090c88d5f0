#include "admin_service.hpp"

#include <chrono>

#include "internal/core/sync_coordinator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/sync_worker.hpp"
#include "internal/util/errors.hpp"
#include "internal/wire/codec.hpp"

namespace vaultsync::service {

using namespace vaultsync::services::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

template <typename Fn>
auto AdminService::Observe(const char* route, Fn&& fn) -> decltype(fn()) {
  vaultsync::observability::SpanScope span(route);
  span.SetAttribute(vaultsync::observability::attr::kRoute, route);
  const auto                          started_at = std::chrono::steady_clock::now();
  auto                                elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    auto resp = fn();
    vaultsync::observability::Metrics::Instance().RecordRequest(route, true);
    vaultsync::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    return resp;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    VAULTSYNC_LOG_ERROR("RPC failed", {vaultsync::observability::StringField("route", route), vaultsync::observability::StringField("error", ex.what())});
    vaultsync::observability::Metrics::Instance().RecordRequest(route, false);
    vaultsync::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

PairResponse AdminService::Pair(const PairRequest& req) {
  return Observe("AdminService.Pair", [&] {
    if (!req.has_token()) {
      throw util::InvalidState("pair request without a device token");
    }
    const auto   entry = ctx_.coordinator->Pair(req.token());
    PairResponse resp;
    resp.set_device_id(entry.device_id);
    return resp;
  });
}

RevokeResponse AdminService::Revoke(const RevokeRequest& req) {
  return Observe("AdminService.Revoke", [&] {
    ctx_.coordinator->Revoke(req.device_id());
    return RevokeResponse{};
  });
}

TriggerSyncResponse AdminService::TriggerSync(const TriggerSyncRequest&) {
  return Observe("AdminService.TriggerSync", [&] {
    TriggerSyncResponse resp;
    resp.set_sessions_started(static_cast<uint32_t>(ctx_.coordinator->TriggerSync()));
    if (ctx_.worker) {
      ctx_.worker->Wake();
    }
    return resp;
  });
}

StatusResponse AdminService::Status(const StatusRequest&) {
  return Observe("AdminService.Status", [&] {
    const auto     status = ctx_.coordinator->Status();
    StatusResponse resp;
    resp.set_device_id(status.device_id);
    resp.set_local_clock(status.local_clock);
    resp.set_record_count(status.record_count);
    for (const auto& peer : status.peers) {
      auto* out = resp.add_peers();
      out->set_device_id(peer.device_id);
      out->set_trust_state(model::TrustStateName(peer.trust));
      out->set_session_state(model::SessionStateName(peer.session_state));
      out->set_last_synced_ms(peer.last_synced_ms);
      out->set_pending_records(peer.pending_records);
      out->set_last_error(peer.last_error);
      out->set_quarantined(peer.quarantined);
    }
    return resp;
  });
}

AppendResponse AdminService::Append(const AppendRequest& req) {
  return Observe("AdminService.Append", [&] {
    const auto     record = ctx_.coordinator->Append(req.entity_id(), req.field_path(), wire::FromProto(req.value()));
    AppendResponse resp;
    wire::ToProto(record, resp.mutable_record());
    return resp;
  });
}

AppendResponse AdminService::DeleteEntity(const DeleteEntityRequest& req) {
  return Observe("AdminService.DeleteEntity", [&] {
    const auto     record = ctx_.coordinator->Delete(req.entity_id());
    AppendResponse resp;
    wire::ToProto(record, resp.mutable_record());
    return resp;
  });
}

SnapshotResponse AdminService::Snapshot(const SnapshotRequest& req) {
  return Observe("AdminService.Snapshot", [&] {
    const auto       snapshot = ctx_.coordinator->Snapshot(req.entity_id());
    SnapshotResponse resp;
    resp.set_entity_id(snapshot.entity_id);
    resp.set_deleted(snapshot.deleted);
    for (const auto& [field_path, value] : snapshot.fields) {
      auto* field = resp.add_fields();
      field->set_field_path(field_path);
      wire::ToProto(value, field->mutable_value());
    }
    return resp;
  });
}

vaultsync::core::v1::DeviceToken AdminService::GetDeviceToken(const DeviceTokenRequest&) {
  return Observe("AdminService.GetDeviceToken", [&] { return ctx_.coordinator->DeviceToken(); });
}

} // namespace vaultsync::service
