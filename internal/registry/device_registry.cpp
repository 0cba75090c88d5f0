#include "device_registry.hpp"

#include <algorithm>

#include "internal/crypto/signatures.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vaultsync::registry {

namespace v1 = vaultsync::core::v1;

using observability::IntField;
using observability::StringField;

namespace {

std::string Serialize(const google::protobuf::MessageLite& message) {
  std::string bytes;
  if (!message.SerializeToString(&bytes)) {
    throw std::runtime_error("failed to serialize registry proof");
  }
  return bytes;
}

model::DeviceEntry EntryFromToken(const v1::DeviceToken& token) {
  model::DeviceEntry entry;
  entry.device_id         = token.device_id();
  entry.signing_public    = token.signing_public();
  entry.encryption_public = token.encryption_public();
  entry.key_epoch         = token.key_epoch();
  entry.token             = Serialize(token);
  return entry;
}

bool IsUsable(const model::DeviceEntry& entry) {
  return entry.trust == model::TrustState::kTrusted && !entry.quarantined;
}

} // namespace

DeviceRegistry::DeviceRegistry(std::shared_ptr<db::Repository> repository, std::string vault_id, std::string local_device_id)
    : repository_(std::move(repository)), vault_id_(std::move(vault_id)), local_device_id_(std::move(local_device_id)) {
  LoadAll();
}

void DeviceRegistry::LoadAll() {
  auto tx      = repository_->Begin();
  auto devices = repository_->ListDevices(*tx);
  tx->Commit();

  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& device : devices) {
    devices_[device.device_id] = std::move(device);
  }
}

void DeviceRegistry::Persist(const model::DeviceEntry& entry) {
  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->UpsertDevice(*tx, entry), "upsert device " + entry.device_id);
  tx->Commit();
}

void DeviceRegistry::RegisterSelf(const v1::DeviceToken& token) {
  if (token.device_id() != local_device_id_ || !crypto::VerifyDeviceToken(token)) {
    throw util::InvalidState("local device token does not match the device identity");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto                        entry = EntryFromToken(token);
  entry.trust                       = model::TrustState::kTrusted;
  if (auto it = devices_.find(entry.device_id); it != devices_.end()) {
    entry.last_synced_ms = it->second.last_synced_ms;
    if (it->second == entry) return;
  }
  Persist(entry);
  devices_[entry.device_id] = entry;
}

model::DeviceEntry DeviceRegistry::Pair(const v1::DeviceToken& token) {
  if (!crypto::VerifyDeviceToken(token)) {
    throw util::AuthenticationFailure("device token signature or fingerprint invalid");
  }
  if (token.vault_id() != vault_id_) {
    throw util::InvalidState("device token belongs to vault " + token.vault_id());
  }
  if (token.device_id() == local_device_id_) {
    throw util::InvalidState("cannot pair with the local device");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto                        entry = EntryFromToken(token);
  entry.trust                       = model::TrustState::kTrusted;

  if (auto it = devices_.find(token.device_id()); it != devices_.end()) {
    const auto& existing = it->second;
    if (existing.trust == model::TrustState::kRevoked) {
      throw util::UnknownOrRevokedSender("device " + token.device_id() + " is revoked");
    }
    // A stale token must not roll back a newer rotated key.
    if (existing.key_epoch > entry.key_epoch) {
      entry.encryption_public          = existing.encryption_public;
      entry.previous_encryption_public = existing.previous_encryption_public;
      entry.key_epoch                  = existing.key_epoch;
      entry.rotation                   = existing.rotation;
    } else if (existing.key_epoch < entry.key_epoch) {
      entry.previous_encryption_public = existing.encryption_public;
    }
    entry.last_seen_clock = existing.last_seen_clock;
    entry.last_synced_ms  = existing.last_synced_ms;
  }

  Persist(entry);
  devices_[entry.device_id] = entry;
  VAULTSYNC_LOG_INFO("device paired", {StringField("device_id", entry.device_id), IntField("key_epoch", static_cast<int64_t>(entry.key_epoch))});
  return entry;
}

bool DeviceRegistry::ApplyRevocation(const v1::RevocationAssertion& revocation) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = devices_.find(revocation.revoked_device_id());
  if (it == devices_.end()) {
    throw util::NotFound("device not found: " + revocation.revoked_device_id());
  }
  if (revocation.revoked_device_id() == local_device_id_) {
    throw util::InvalidState("cannot revoke the local device");
  }

  auto entry = it->second;
  if (entry.trust == model::TrustState::kRevoked && entry.revoked_after_clock <= revocation.cutoff_clock()) {
    return false;
  }

  entry.trust               = model::TrustState::kRevoked;
  entry.revoked_after_clock = revocation.cutoff_clock();
  entry.revocation          = Serialize(revocation);

  Persist(entry);
  it->second = entry;
  VAULTSYNC_LOG_WARN("device revoked", {StringField("device_id", entry.device_id), IntField("cutoff_clock", static_cast<int64_t>(entry.revoked_after_clock)),
                                        StringField("issuer", revocation.issuer())});
  return true;
}

bool DeviceRegistry::ApplyKeyRotation(const v1::KeyRotation& rotation) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = devices_.find(rotation.device_id());
  if (it == devices_.end() || it->second.trust == model::TrustState::kRevoked) {
    return false;
  }
  auto entry = it->second;
  if (rotation.key_epoch() <= entry.key_epoch) {
    return false;
  }
  if (rotation.encryption_public().size() != crypto::kKeySize || !crypto::VerifyMessage(rotation, entry.signing_public)) {
    throw util::AuthenticationFailure("key rotation signature invalid for device " + rotation.device_id());
  }

  entry.previous_encryption_public = entry.encryption_public;
  entry.encryption_public          = rotation.encryption_public();
  entry.key_epoch                  = rotation.key_epoch();
  entry.rotation                   = Serialize(rotation);

  Persist(entry);
  it->second = entry;
  VAULTSYNC_LOG_INFO("device key rotated", {StringField("device_id", entry.device_id), IntField("key_epoch", static_cast<int64_t>(entry.key_epoch))});
  return true;
}

bool DeviceRegistry::ApplyDeviceAssertion(const v1::DeviceAssertion& assertion) {
  const auto& subject = assertion.subject();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        introducer = devices_.find(assertion.introducer());
    if (introducer == devices_.end() || !IsUsable(introducer->second)) {
      return false;
    }
    if (!crypto::VerifyMessage(assertion, introducer->second.signing_public)) {
      throw util::AuthenticationFailure("device assertion signature invalid from " + assertion.introducer());
    }
    if (auto known = devices_.find(subject.device_id()); known != devices_.end()) {
      if (known->second.trust != model::TrustState::kPending) {
        return false;
      }
    }
  }
  if (subject.device_id() == local_device_id_) {
    return false;
  }

  Pair(subject);
  return true;
}

bool DeviceRegistry::ApplyRevocationAssertion(const v1::RevocationAssertion& revocation) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        issuer = devices_.find(revocation.issuer());
    if (issuer == devices_.end() || !IsUsable(issuer->second)) {
      return false;
    }
    if (!crypto::VerifyMessage(revocation, issuer->second.signing_public)) {
      throw util::AuthenticationFailure("revocation signature invalid from " + revocation.issuer());
    }
    if (!devices_.contains(revocation.revoked_device_id()) || revocation.revoked_device_id() == local_device_id_) {
      return false;
    }
  }
  return ApplyRevocation(revocation);
}

void DeviceRegistry::Quarantine(const std::string& device_id, const std::string& reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = devices_.find(device_id);
  if (it == devices_.end() || it->second.quarantined || device_id == local_device_id_) {
    return;
  }
  auto entry        = it->second;
  entry.quarantined = true;
  Persist(entry);
  it->second = entry;
  VAULTSYNC_LOG_ERROR("device quarantined", {StringField("device_id", device_id), StringField("reason", reason)});
}

void DeviceRegistry::RecordSync(const std::string& device_id, std::int64_t synced_at_ms, std::uint64_t seen_clock) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = devices_.find(device_id);
  if (it == devices_.end()) {
    return;
  }
  auto entry            = it->second;
  entry.last_synced_ms  = synced_at_ms;
  entry.last_seen_clock = std::max(entry.last_seen_clock, seen_clock);
  Persist(entry);
  it->second = entry;
}

std::optional<model::DeviceEntry> DeviceRegistry::Get(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = devices_.find(device_id);
  if (it == devices_.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DeviceEntry> DeviceRegistry::List() const {
  std::lock_guard<std::mutex>     lock(mutex_);
  std::vector<model::DeviceEntry> out;
  for (const auto& [_, entry] : devices_)
    out.push_back(entry);
  return out;
}

std::vector<model::DeviceEntry> DeviceRegistry::TrustedPeers() const {
  std::lock_guard<std::mutex>     lock(mutex_);
  std::vector<model::DeviceEntry> out;
  for (const auto& [id, entry] : devices_) {
    if (id != local_device_id_ && IsUsable(entry)) out.push_back(entry);
  }
  return out;
}

OriginStatus DeviceRegistry::ClassifyOrigin(const std::string& device_id, std::uint64_t logical_clock) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = devices_.find(device_id);
  if (it == devices_.end() || it->second.trust == model::TrustState::kPending || it->second.quarantined) {
    return OriginStatus::kUnknown;
  }
  if (it->second.trust == model::TrustState::kRevoked && logical_clock > it->second.revoked_after_clock) {
    return OriginStatus::kRejected;
  }
  return OriginStatus::kAccepted;
}

model::DeviceEntry DeviceRegistry::RequireSender(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = devices_.find(device_id);
  if (it == devices_.end() || !IsUsable(it->second) || device_id == local_device_id_) {
    throw util::UnknownOrRevokedSender("sender not trusted: " + device_id);
  }
  return it->second;
}

} // namespace vaultsync::registry
