#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "internal/util/secure_bytes.hpp"

namespace vaultsync::crypto {

inline constexpr std::size_t kKeySize       = 32;
inline constexpr std::size_t kSignatureSize = 64;

using PrivateKey = util::SecretBytes<kKeySize>;

// Raw 32-byte public key plus its private half.
struct KeyPair {
  std::string public_key;
  PrivateKey  private_key;
};

KeyPair GenerateSigningKeyPair();
KeyPair GenerateEncryptionKeyPair();

// Rebuild a pair from a stored private key.
KeyPair SigningKeyPairFromPrivate(std::string_view private_key);
KeyPair EncryptionKeyPairFromPrivate(std::string_view private_key);

// Ed25519.
std::string Sign(const PrivateKey& signing_private, std::string_view message);
bool        Verify(std::string_view signing_public, std::string_view message, std::string_view signature);

// X25519 shared secret.
util::SecretBytes<kKeySize> DeriveSharedSecret(const PrivateKey& own_private, std::string_view peer_public);

std::string Sha256(std::string_view data);
std::string RandomBytes(std::size_t size);

// Lowercase hex of the first 16 bytes of SHA-256(signing_public).
std::string Fingerprint(std::string_view signing_public);

inline std::string PrivateKeyBytes(const PrivateKey& key) {
  return std::string(reinterpret_cast<const char*>(key.data()), key.size());
}

} // namespace vaultsync::crypto
