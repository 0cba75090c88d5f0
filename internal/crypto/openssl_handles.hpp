#pragma once

#include <memory>
#include <string>

#include <openssl/evp.h>

namespace vaultsync::crypto {

struct PkeyDeleter {
  void operator()(EVP_PKEY* key) const {
    EVP_PKEY_free(key);
  }
};

struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* ctx) const {
    EVP_PKEY_CTX_free(ctx);
  }
};

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using PkeyPtr    = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using MdCtxPtr   = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

/*
  RAII wrapper for EVP_CIPHER_CTX.
*/
class CipherContext {
 public:
  CipherContext();
  ~CipherContext();

  CipherContext(const CipherContext&)            = delete;
  CipherContext& operator=(const CipherContext&) = delete;

  EVP_CIPHER_CTX* get() const {
    return ctx_;
  }

 private:
  EVP_CIPHER_CTX* ctx_;
};

// Throws std::runtime_error carrying the OpenSSL error queue.
[[noreturn]] void ThrowOpenSslError(const std::string& what);

} // namespace vaultsync::crypto
