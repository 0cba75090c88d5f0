#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/crypto/key_store.hpp"
#include "internal/crypto/keys.hpp"
#include "vaultsync/core/v1/identity.pb.h"

namespace vaultsync::crypto {

/*
  The local device's long-lived keys.

  The signing key is stable for the device's lifetime and defines its id.
  The encryption key rotates; the previous one is kept for a single epoch.
*/
class DeviceIdentity {
 public:
  static DeviceIdentity Generate();
  static DeviceIdentity FromKeyMaterial(const vaultsync::core::v1::KeyMaterial& material);

  // Loads from the store, generating and saving a fresh identity if empty.
  static DeviceIdentity LoadOrCreate(KeyStore& store);

  const std::string& device_id() const {
    return device_id_;
  }
  const KeyPair& signing() const {
    return signing_;
  }
  const KeyPair& encryption() const {
    return encryption_;
  }
  const std::optional<KeyPair>& previous_encryption() const {
    return previous_encryption_;
  }
  std::uint64_t key_epoch() const {
    return key_epoch_;
  }

  vaultsync::core::v1::DeviceToken MakeToken(const std::string& vault_id, std::int64_t issued_at_ms) const;

  // Generates a new encryption key pair and returns the signed rotation notice.
  vaultsync::core::v1::KeyRotation RotateEncryptionKey();

  vaultsync::core::v1::KeyMaterial ToKeyMaterial() const;

 private:
  DeviceIdentity(KeyPair signing, KeyPair encryption, std::uint64_t key_epoch);

  KeyPair                signing_;
  KeyPair                encryption_;
  std::optional<KeyPair> previous_encryption_;
  std::uint64_t          key_epoch_ = 1;
  std::string            device_id_;
};

} // namespace vaultsync::crypto
