#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include <openssl/crypto.h>

namespace vaultsync::util {

inline void SecureWipe(void* data, std::size_t len) {
  if (!data || len == 0) {
    return;
  }
  OPENSSL_cleanse(data, len);
}

inline void SecureWipe(std::string& buf) {
  SecureWipe(buf.data(), buf.size());
}

template <std::size_t N>
inline void SecureWipe(std::array<uint8_t, N>& buf) {
  SecureWipe(buf.data(), buf.size());
}

/*
  Fixed-size secret that wipes itself on destruction.
*/
template <std::size_t N>
class SecretBytes {
 public:
  SecretBytes() = default;
  explicit SecretBytes(const std::array<uint8_t, N>& bytes) : bytes_(bytes) {
  }
  ~SecretBytes() {
    SecureWipe(bytes_);
  }

  SecretBytes(const SecretBytes&)            = default;
  SecretBytes& operator=(const SecretBytes&) = default;

  const uint8_t* data() const {
    return bytes_.data();
  }
  uint8_t* data() {
    return bytes_.data();
  }
  static constexpr std::size_t size() {
    return N;
  }

 private:
  std::array<uint8_t, N> bytes_{};
};

} // namespace vaultsync::util
