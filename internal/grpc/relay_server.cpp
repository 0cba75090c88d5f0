#include "relay_server.hpp"

#include <algorithm>

#include "grpc_error.hpp"
#include "internal/observability/spans.hpp"

namespace vaultsync::grpc {

using namespace vaultsync::services::v1;

RelayServer::RelayServer(std::shared_ptr<vaultsync::relay::RelayStore> store, std::uint32_t fetch_max)
    : store_(std::move(store)), fetch_max_(fetch_max == 0 ? 1 : fetch_max) {
}

::grpc::Status RelayServer::Put(::grpc::ServerContext*, const PutRequest* req, PutResponse* resp) {
  vaultsync::observability::SpanScope span(vaultsync::observability::kSpanRelayPut);
  span.SetAttribute(vaultsync::observability::attr::kSenderId, req->batch().sender_id());
  span.SetAttribute(vaultsync::observability::attr::kRecipientId, req->batch().recipient_id());
  try {
    store_->Put(req->batch());
    resp->set_queued(store_->Queued(req->batch().recipient_id()));
    vaultsync::observability::Metrics::Instance().RecordRequest("RelayService.Put", true);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    vaultsync::observability::Metrics::Instance().RecordRequest("RelayService.Put", false);
    return ToStatus(e);
  }
}

::grpc::Status RelayServer::Fetch(::grpc::ServerContext*, const FetchRequest* req, FetchResponse* resp) {
  vaultsync::observability::SpanScope span(vaultsync::observability::kSpanRelayFetch);
  span.SetAttribute(vaultsync::observability::attr::kRecipientId, req->recipient_id());
  try {
    if (req->recipient_id().empty()) {
      throw std::invalid_argument("recipient_id is required");
    }
    const auto max_batches = req->max_batches() == 0 ? fetch_max_ : std::min(req->max_batches(), fetch_max_);
    for (auto& batch : store_->Fetch(req->recipient_id(), max_batches)) {
      *resp->add_batches() = std::move(batch);
    }
    span.SetAttribute(vaultsync::observability::attr::kBatches, static_cast<std::int64_t>(resp->batches_size()));
    vaultsync::observability::Metrics::Instance().RecordRequest("RelayService.Fetch", true);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    vaultsync::observability::Metrics::Instance().RecordRequest("RelayService.Fetch", false);
    return ToStatus(e);
  }
}

} // namespace vaultsync::grpc
