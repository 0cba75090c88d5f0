#include "relay_client.hpp"

#include "internal/util/errors.hpp"

namespace vaultsync::grpc {

using namespace vaultsync::services::v1;

GrpcRelayClient::GrpcRelayClient(const std::string& endpoint, std::chrono::milliseconds rpc_timeout)
    : stub_(RelayService::NewStub(::grpc::CreateChannel(endpoint, ::grpc::InsecureChannelCredentials()))), rpc_timeout_(rpc_timeout) {
}

void GrpcRelayClient::Put(const vaultsync::wire::v1::SealedBatch& batch) {
  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + rpc_timeout_);

  PutRequest req;
  *req.mutable_batch() = batch;
  PutResponse resp;

  const auto status = stub_->Put(&ctx, req, &resp);
  if (!status.ok()) {
    throw util::RelayRejected("relay put failed: " + status.error_message());
  }
}

std::vector<vaultsync::wire::v1::SealedBatch> GrpcRelayClient::Fetch(const std::string& recipient_id, std::uint32_t max_batches) {
  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + rpc_timeout_);

  FetchRequest req;
  req.set_recipient_id(recipient_id);
  req.set_max_batches(max_batches);
  FetchResponse resp;

  const auto status = stub_->Fetch(&ctx, req, &resp);
  if (!status.ok()) {
    throw util::RelayRejected("relay fetch failed: " + status.error_message());
  }

  std::vector<vaultsync::wire::v1::SealedBatch> out;
  out.reserve(static_cast<std::size_t>(resp.batches_size()));
  for (auto& batch : *resp.mutable_batches()) {
    out.push_back(std::move(batch));
  }
  return out;
}

} // namespace vaultsync::grpc
