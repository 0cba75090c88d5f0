#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "vaultsync/wire/v1/envelope.pb.h"

namespace vaultsync::transport {

// Where a relay transport drops and collects sealed batches.
class RelayEndpoint {
 public:
  virtual ~RelayEndpoint() = default;

  // Throws util::RelayRejected when the relay refuses or is unavailable.
  virtual void Put(const vaultsync::wire::v1::SealedBatch& batch) = 0;

  virtual std::vector<vaultsync::wire::v1::SealedBatch> Fetch(const std::string& recipient_id, std::uint32_t max_batches) = 0;
};

} // namespace vaultsync::transport
