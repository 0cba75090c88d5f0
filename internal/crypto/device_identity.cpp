#include "device_identity.hpp"

#include "internal/crypto/signatures.hpp"
#include "internal/observability/logging.hpp"

namespace vaultsync::crypto {

DeviceIdentity::DeviceIdentity(KeyPair signing, KeyPair encryption, std::uint64_t key_epoch)
    : signing_(std::move(signing)), encryption_(std::move(encryption)), key_epoch_(key_epoch), device_id_(Fingerprint(signing_.public_key)) {
}

DeviceIdentity DeviceIdentity::Generate() {
  return DeviceIdentity(GenerateSigningKeyPair(), GenerateEncryptionKeyPair(), 1);
}

DeviceIdentity DeviceIdentity::FromKeyMaterial(const vaultsync::core::v1::KeyMaterial& material) {
  DeviceIdentity identity(SigningKeyPairFromPrivate(material.signing_private()), EncryptionKeyPairFromPrivate(material.encryption_private()),
                          material.key_epoch() == 0 ? 1 : material.key_epoch());
  if (!material.previous_encryption_private().empty()) {
    identity.previous_encryption_ = EncryptionKeyPairFromPrivate(material.previous_encryption_private());
  }
  return identity;
}

DeviceIdentity DeviceIdentity::LoadOrCreate(KeyStore& store) {
  if (auto material = store.Load()) {
    return FromKeyMaterial(*material);
  }

  auto identity = Generate();
  store.Save(identity.ToKeyMaterial());
  VAULTSYNC_LOG_INFO("generated device identity", {observability::StringField("device_id", identity.device_id())});
  return identity;
}

vaultsync::core::v1::DeviceToken DeviceIdentity::MakeToken(const std::string& vault_id, std::int64_t issued_at_ms) const {
  vaultsync::core::v1::DeviceToken token;
  token.set_device_id(device_id_);
  token.set_signing_public(signing_.public_key);
  token.set_encryption_public(encryption_.public_key);
  token.set_key_epoch(key_epoch_);
  token.set_issued_at_ms(issued_at_ms);
  token.set_vault_id(vault_id);
  SignMessage(&token, signing_.private_key);
  return token;
}

vaultsync::core::v1::KeyRotation DeviceIdentity::RotateEncryptionKey() {
  previous_encryption_ = encryption_;
  encryption_          = GenerateEncryptionKeyPair();
  ++key_epoch_;

  vaultsync::core::v1::KeyRotation rotation;
  rotation.set_device_id(device_id_);
  rotation.set_encryption_public(encryption_.public_key);
  rotation.set_key_epoch(key_epoch_);
  SignMessage(&rotation, signing_.private_key);
  return rotation;
}

vaultsync::core::v1::KeyMaterial DeviceIdentity::ToKeyMaterial() const {
  vaultsync::core::v1::KeyMaterial material;
  material.set_signing_private(PrivateKeyBytes(signing_.private_key));
  material.set_encryption_private(PrivateKeyBytes(encryption_.private_key));
  material.set_key_epoch(key_epoch_);
  if (previous_encryption_) {
    material.set_previous_encryption_private(PrivateKeyBytes(previous_encryption_->private_key));
  }
  return material;
}

} // namespace vaultsync::crypto
