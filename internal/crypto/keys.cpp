#include "keys.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <cstring>
#include <stdexcept>

#include "internal/crypto/openssl_handles.hpp"
#include "internal/util/hex.hpp"

namespace vaultsync::crypto {

namespace {

const unsigned char* Bytes(std::string_view s) {
  return reinterpret_cast<const unsigned char*>(s.data());
}

std::string RawPublic(EVP_PKEY* key) {
  std::string out(kKeySize, '\0');
  size_t      len = out.size();
  if (EVP_PKEY_get_raw_public_key(key, reinterpret_cast<unsigned char*>(out.data()), &len) != 1 || len != kKeySize) {
    ThrowOpenSslError("EVP_PKEY_get_raw_public_key");
  }
  return out;
}

PrivateKey RawPrivate(EVP_PKEY* key) {
  PrivateKey out;
  size_t     len = out.size();
  if (EVP_PKEY_get_raw_private_key(key, out.data(), &len) != 1 || len != kKeySize) {
    ThrowOpenSslError("EVP_PKEY_get_raw_private_key");
  }
  return out;
}

KeyPair Generate(int type) {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(type, nullptr));
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    ThrowOpenSslError("EVP_PKEY_keygen_init");
  }

  EVP_PKEY* raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
    ThrowOpenSslError("EVP_PKEY_keygen");
  }
  PkeyPtr key(raw);

  return KeyPair{RawPublic(key.get()), RawPrivate(key.get())};
}

PkeyPtr LoadPrivate(int type, const PrivateKey& private_key) {
  PkeyPtr key(EVP_PKEY_new_raw_private_key(type, nullptr, private_key.data(), private_key.size()));
  if (!key) {
    ThrowOpenSslError("EVP_PKEY_new_raw_private_key");
  }
  return key;
}

KeyPair FromPrivate(int type, std::string_view private_key) {
  if (private_key.size() != kKeySize) {
    throw std::invalid_argument("private key must be 32 bytes");
  }
  std::array<uint8_t, kKeySize> raw{};
  std::memcpy(raw.data(), private_key.data(), kKeySize);
  PrivateKey secret(raw);
  util::SecureWipe(raw);

  auto key = LoadPrivate(type, secret);
  return KeyPair{RawPublic(key.get()), secret};
}

} // namespace

KeyPair GenerateSigningKeyPair() {
  return Generate(EVP_PKEY_ED25519);
}

KeyPair GenerateEncryptionKeyPair() {
  return Generate(EVP_PKEY_X25519);
}

KeyPair SigningKeyPairFromPrivate(std::string_view private_key) {
  return FromPrivate(EVP_PKEY_ED25519, private_key);
}

KeyPair EncryptionKeyPairFromPrivate(std::string_view private_key) {
  return FromPrivate(EVP_PKEY_X25519, private_key);
}

std::string Sign(const PrivateKey& signing_private, std::string_view message) {
  auto     key = LoadPrivate(EVP_PKEY_ED25519, signing_private);
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
    ThrowOpenSslError("EVP_DigestSignInit");
  }

  std::string signature(kSignatureSize, '\0');
  size_t      len = signature.size();
  if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char*>(signature.data()), &len, Bytes(message), message.size()) != 1) {
    ThrowOpenSslError("EVP_DigestSign");
  }
  signature.resize(len);
  return signature;
}

bool Verify(std::string_view signing_public, std::string_view message, std::string_view signature) {
  if (signing_public.size() != kKeySize || signature.size() != kSignatureSize) {
    return false;
  }

  PkeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, Bytes(signing_public), signing_public.size()));
  if (!key) {
    return false;
  }

  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
    ThrowOpenSslError("EVP_DigestVerifyInit");
  }
  return EVP_DigestVerify(ctx.get(), Bytes(signature), signature.size(), Bytes(message), message.size()) == 1;
}

util::SecretBytes<kKeySize> DeriveSharedSecret(const PrivateKey& own_private, std::string_view peer_public) {
  if (peer_public.size() != kKeySize) {
    throw std::invalid_argument("public key must be 32 bytes");
  }

  auto    own = LoadPrivate(EVP_PKEY_X25519, own_private);
  PkeyPtr peer(EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, Bytes(peer_public), peer_public.size()));
  if (!peer) {
    ThrowOpenSslError("EVP_PKEY_new_raw_public_key");
  }

  PkeyCtxPtr ctx(EVP_PKEY_CTX_new(own.get(), nullptr));
  if (!ctx || EVP_PKEY_derive_init(ctx.get()) != 1 || EVP_PKEY_derive_set_peer(ctx.get(), peer.get()) != 1) {
    ThrowOpenSslError("EVP_PKEY_derive_init");
  }

  util::SecretBytes<kKeySize> secret;
  size_t                      len = secret.size();
  if (EVP_PKEY_derive(ctx.get(), secret.data(), &len) != 1 || len != kKeySize) {
    ThrowOpenSslError("EVP_PKEY_derive");
  }
  return secret;
}

std::string Sha256(std::string_view data) {
  std::string  digest(EVP_MAX_MD_SIZE, '\0');
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), reinterpret_cast<unsigned char*>(digest.data()), &len, EVP_sha256(), nullptr) != 1) {
    ThrowOpenSslError("EVP_Digest");
  }
  digest.resize(len);
  return digest;
}

std::string RandomBytes(std::size_t size) {
  std::string out(size, '\0');
  if (size > 0 && RAND_bytes(reinterpret_cast<unsigned char*>(out.data()), static_cast<int>(size)) != 1) {
    ThrowOpenSslError("RAND_bytes");
  }
  return out;
}

std::string Fingerprint(std::string_view signing_public) {
  const auto digest = Sha256(signing_public);
  return util::ToHex(std::string_view(digest).substr(0, 16));
}

} // namespace vaultsync::crypto
