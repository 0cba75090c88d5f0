#pragma once

#include <mutex>
#include <optional>
#include <string>

#include "vaultsync/core/v1/identity.pb.h"

namespace vaultsync::crypto {

/*
  Holds the device's private key material.

  Platform keychains plug in here; the daemon uses FileKeyStore.
*/
class KeyStore {
 public:
  virtual ~KeyStore() = default;

  virtual std::optional<vaultsync::core::v1::KeyMaterial> Load()                                      = 0;
  virtual void                                            Save(const vaultsync::core::v1::KeyMaterial&) = 0;
};

class MemoryKeyStore final : public KeyStore {
 public:
  std::optional<vaultsync::core::v1::KeyMaterial> Load() override;
  void                                            Save(const vaultsync::core::v1::KeyMaterial& material) override;

 private:
  std::mutex                                      mutex_;
  std::optional<vaultsync::core::v1::KeyMaterial> material_;
};

// Binary protobuf file created with mode 0600 and replaced atomically.
class FileKeyStore final : public KeyStore {
 public:
  explicit FileKeyStore(std::string path);

  std::optional<vaultsync::core::v1::KeyMaterial> Load() override;
  void                                            Save(const vaultsync::core::v1::KeyMaterial& material) override;

 private:
  std::string path_;
};

} // namespace vaultsync::crypto
