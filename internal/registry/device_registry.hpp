#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/device.hpp"
#include "vaultsync/core/v1/identity.pb.h"

namespace vaultsync::registry {

enum class OriginStatus {
  kAccepted,
  // Not paired yet, pending or quarantined; may become acceptable later.
  kUnknown,
  // Revoked and the record is past the revocation cutoff.
  kRejected,
};

/*
  Known device identities of one vault and their trust state.

  Every mutation is persisted before the in-memory view changes. Trust only
  changes through a verified token (pairing), a revocation, a verified key
  rotation or a verified assertion from a trusted device.
*/
class DeviceRegistry {
 public:
  DeviceRegistry(std::shared_ptr<db::Repository> repository, std::string vault_id, std::string local_device_id);

  const std::string& local_device_id() const {
    return local_device_id_;
  }
  const std::string& vault_id() const {
    return vault_id_;
  }

  // Registers the local device from its own token.
  void RegisterSelf(const vaultsync::core::v1::DeviceToken& token);

  // Verifies the token and marks the device trusted. Re-pairing a
  // quarantined device clears the quarantine; revoked devices stay revoked.
  model::DeviceEntry Pair(const vaultsync::core::v1::DeviceToken& token);

  // Records the signed revocation. Returns false if it changed nothing.
  bool ApplyRevocation(const vaultsync::core::v1::RevocationAssertion& revocation);

  bool ApplyKeyRotation(const vaultsync::core::v1::KeyRotation& rotation);

  // Assertions received from peers; issuer/introducer must be trusted.
  bool ApplyDeviceAssertion(const vaultsync::core::v1::DeviceAssertion& assertion);
  bool ApplyRevocationAssertion(const vaultsync::core::v1::RevocationAssertion& revocation);

  void Quarantine(const std::string& device_id, const std::string& reason);
  void RecordSync(const std::string& device_id, std::int64_t synced_at_ms, std::uint64_t seen_clock);

  std::optional<model::DeviceEntry> Get(const std::string& device_id) const;
  std::vector<model::DeviceEntry>   List() const;

  // Trusted, unquarantined devices other than the local one.
  std::vector<model::DeviceEntry> TrustedPeers() const;

  // Whether the device may author a record at logical_clock.
  OriginStatus ClassifyOrigin(const std::string& device_id, std::uint64_t logical_clock) const;

  // Throws util::UnknownOrRevokedSender unless the device may send batches.
  model::DeviceEntry RequireSender(const std::string& device_id) const;

 private:
  void LoadAll();
  void Persist(const model::DeviceEntry& entry);

  std::shared_ptr<db::Repository> repository_;
  std::string                     vault_id_;
  std::string                     local_device_id_;

  mutable std::mutex                        mutex_;
  std::map<std::string, model::DeviceEntry> devices_;
};

} // namespace vaultsync::registry
