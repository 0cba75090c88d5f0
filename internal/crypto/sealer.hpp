#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "internal/crypto/keys.hpp"

namespace vaultsync::crypto {

/*
  Authenticated public-key encryption between two device key pairs.

  Layout: version(1) | salt(16) | nonce(12) | ciphertext | tag(16)

  The AES-256-GCM key is HKDF-SHA256 over the X25519 shared secret with a
  fresh salt per message; both public keys are bound into the HKDF info so a
  ciphertext cannot be re-targeted. The header is authenticated as AAD.
  Plaintext is length-prefixed and zero padded to a multiple of padding_block.
*/
class Sealer {
 public:
  static constexpr std::size_t kDefaultPaddingBlock = 256;

  explicit Sealer(std::size_t padding_block = kDefaultPaddingBlock);

  std::string Seal(std::string_view plaintext, std::string_view recipient_public, const KeyPair& sender) const;

  // Throws util::AuthenticationFailure on any tampering or wrong key.
  std::string Open(std::string_view ciphertext, std::string_view sender_public, const KeyPair& recipient) const;

  std::size_t padding_block() const {
    return padding_block_;
  }

 private:
  std::size_t padding_block_;
};

} // namespace vaultsync::crypto
