#pragma once

#include <optional>
#include <string>

#include "vaultsync/wire/v1/envelope.pb.h"

namespace vaultsync::transport {

/*
  Moves sealed batches between devices.

  Direct and relay-mediated implementations behave the same to callers:
  delivery is best effort, unordered and may duplicate. Nothing here looks
  inside the ciphertext.
*/
class Transport {
 public:
  virtual ~Transport() = default;

  // Throws util::TransportUnreachable or util::RelayRejected.
  virtual void Send(const std::string& peer_id, const vaultsync::wire::v1::SealedBatch& batch) = 0;

  // Non-blocking; nullopt when nothing is waiting.
  virtual std::optional<vaultsync::wire::v1::SealedBatch> Receive() = 0;
};

} // namespace vaultsync::transport
