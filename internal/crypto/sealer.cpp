#include "sealer.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>

#include <cstdint>
#include <stdexcept>

#include "internal/crypto/openssl_handles.hpp"
#include "internal/util/errors.hpp"

namespace vaultsync::crypto {

namespace {

constexpr uint8_t     kVersion   = 1;
constexpr std::size_t kSaltSize  = 16;
constexpr std::size_t kNonceSize = 12;
constexpr std::size_t kTagSize   = 16;
constexpr std::size_t kHeader    = 1 + kSaltSize + kNonceSize;
constexpr std::size_t kLenPrefix = 4;

constexpr std::string_view kInfoLabel = "vaultsync/seal/v1";

const unsigned char* Bytes(std::string_view s) {
  return reinterpret_cast<const unsigned char*>(s.data());
}

unsigned char* MutableBytes(std::string& s) {
  return reinterpret_cast<unsigned char*>(s.data());
}

util::SecretBytes<kKeySize> DeriveMessageKey(const util::SecretBytes<kKeySize>& shared, std::string_view salt,
                                             std::string_view sender_public, std::string_view recipient_public) {
  std::string info(kInfoLabel);
  info.append(sender_public);
  info.append(recipient_public);

  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
  if (!ctx || EVP_PKEY_derive_init(ctx.get()) != 1) {
    ThrowOpenSslError("HKDF init");
  }
  if (EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) != 1 ||
      EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), Bytes(salt), static_cast<int>(salt.size())) != 1 ||
      EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), shared.data(), static_cast<int>(shared.size())) != 1 ||
      EVP_PKEY_CTX_add1_hkdf_info(ctx.get(), Bytes(info), static_cast<int>(info.size())) != 1) {
    ThrowOpenSslError("HKDF parameters");
  }

  util::SecretBytes<kKeySize> key;
  size_t                      len = key.size();
  if (EVP_PKEY_derive(ctx.get(), key.data(), &len) != 1 || len != kKeySize) {
    ThrowOpenSslError("HKDF derive");
  }
  return key;
}

std::string Pad(std::string_view plaintext, std::size_t block) {
  const std::size_t body   = kLenPrefix + plaintext.size();
  const std::size_t padded = ((body + block - 1) / block) * block;

  std::string out(padded, '\0');
  const auto  len = static_cast<uint32_t>(plaintext.size());
  out[0]          = static_cast<char>((len >> 24) & 0xFF);
  out[1]          = static_cast<char>((len >> 16) & 0xFF);
  out[2]          = static_cast<char>((len >> 8) & 0xFF);
  out[3]          = static_cast<char>(len & 0xFF);
  out.replace(kLenPrefix, plaintext.size(), plaintext);
  return out;
}

std::string Unpad(const std::string& padded) {
  if (padded.size() < kLenPrefix) {
    throw util::AuthenticationFailure("sealed payload too short");
  }
  const auto* p   = reinterpret_cast<const uint8_t*>(padded.data());
  const auto  len = (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) | (static_cast<uint32_t>(p[2]) << 8) |
                   static_cast<uint32_t>(p[3]);
  if (len > padded.size() - kLenPrefix) {
    throw util::AuthenticationFailure("sealed payload length prefix out of range");
  }
  return padded.substr(kLenPrefix, len);
}

} // namespace

Sealer::Sealer(std::size_t padding_block) : padding_block_(padding_block) {
  if (padding_block_ == 0) {
    throw std::invalid_argument("padding block must be positive");
  }
}

std::string Sealer::Seal(std::string_view plaintext, std::string_view recipient_public, const KeyPair& sender) const {
  if (plaintext.size() > UINT32_MAX - kLenPrefix) {
    throw std::invalid_argument("plaintext too large to seal");
  }

  const auto salt   = RandomBytes(kSaltSize);
  const auto nonce  = RandomBytes(kNonceSize);
  const auto shared = DeriveSharedSecret(sender.private_key, recipient_public);
  const auto key    = DeriveMessageKey(shared, salt, sender.public_key, recipient_public);

  std::string padded = Pad(plaintext, padding_block_);

  std::string out;
  out.reserve(kHeader + padded.size() + kTagSize);
  out.push_back(static_cast<char>(kVersion));
  out.append(salt);
  out.append(nonce);

  CipherContext ctx;
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), Bytes(nonce)) != 1) {
    ThrowOpenSslError("EVP_EncryptInit_ex");
  }

  int len = 0;
  if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, Bytes(out), static_cast<int>(kHeader)) != 1) {
    ThrowOpenSslError("EVP_EncryptUpdate(aad)");
  }

  std::string ciphertext(padded.size(), '\0');
  if (EVP_EncryptUpdate(ctx.get(), MutableBytes(ciphertext), &len, Bytes(padded), static_cast<int>(padded.size())) != 1) {
    ThrowOpenSslError("EVP_EncryptUpdate");
  }
  int total = len;
  if (EVP_EncryptFinal_ex(ctx.get(), MutableBytes(ciphertext) + total, &len) != 1) {
    ThrowOpenSslError("EVP_EncryptFinal_ex");
  }
  total += len;
  ciphertext.resize(static_cast<std::size_t>(total));
  util::SecureWipe(padded);

  std::string tag(kTagSize, '\0');
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize), tag.data()) != 1) {
    ThrowOpenSslError("EVP_CTRL_GCM_GET_TAG");
  }

  out.append(ciphertext);
  out.append(tag);
  return out;
}

std::string Sealer::Open(std::string_view ciphertext, std::string_view sender_public, const KeyPair& recipient) const {
  if (ciphertext.size() < kHeader + kTagSize) {
    throw util::AuthenticationFailure("sealed payload too short");
  }
  if (static_cast<uint8_t>(ciphertext[0]) != kVersion) {
    throw util::AuthenticationFailure("unsupported sealed payload version");
  }

  const auto salt  = ciphertext.substr(1, kSaltSize);
  const auto nonce = ciphertext.substr(1 + kSaltSize, kNonceSize);
  const auto body  = ciphertext.substr(kHeader, ciphertext.size() - kHeader - kTagSize);
  std::string tag(ciphertext.substr(ciphertext.size() - kTagSize));

  util::SecretBytes<kKeySize> shared;
  try {
    shared = DeriveSharedSecret(recipient.private_key, sender_public);
  } catch (const std::exception& e) {
    throw util::AuthenticationFailure(std::string("key agreement failed: ") + e.what());
  }
  const auto key = DeriveMessageKey(shared, salt, sender_public, recipient.public_key);

  CipherContext ctx;
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), Bytes(nonce)) != 1) {
    ThrowOpenSslError("EVP_DecryptInit_ex");
  }

  int len = 0;
  if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, Bytes(ciphertext), static_cast<int>(kHeader)) != 1) {
    throw util::AuthenticationFailure("sealed payload header rejected");
  }

  std::string padded(body.size(), '\0');
  if (EVP_DecryptUpdate(ctx.get(), MutableBytes(padded), &len, Bytes(body), static_cast<int>(body.size())) != 1) {
    throw util::AuthenticationFailure("sealed payload body rejected");
  }
  int total = len;

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), tag.data()) != 1) {
    ThrowOpenSslError("EVP_CTRL_GCM_SET_TAG");
  }
  if (EVP_DecryptFinal_ex(ctx.get(), MutableBytes(padded) + total, &len) != 1) {
    util::SecureWipe(padded);
    throw util::AuthenticationFailure("sealed payload failed authentication");
  }
  total += len;
  padded.resize(static_cast<std::size_t>(total));

  auto plaintext = Unpad(padded);
  util::SecureWipe(padded);
  return plaintext;
}

} // namespace vaultsync::crypto
