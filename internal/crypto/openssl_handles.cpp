#include "openssl_handles.hpp"

#include <openssl/err.h>

#include <stdexcept>

namespace vaultsync::crypto {

CipherContext::CipherContext() : ctx_(EVP_CIPHER_CTX_new()) {
  if (!ctx_) {
    ThrowOpenSslError("EVP_CIPHER_CTX_new");
  }
}

CipherContext::~CipherContext() {
  if (ctx_) {
    EVP_CIPHER_CTX_free(ctx_);
  }
}

void ThrowOpenSslError(const std::string& what) {
  const unsigned long code = ERR_get_error();
  ERR_clear_error();

  std::string message = what + " failed";
  if (code != 0) {
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    message += ": ";
    message += buf;
  }
  throw std::runtime_error(message);
}

} // namespace vaultsync::crypto
