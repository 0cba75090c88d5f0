#include "signatures.hpp"

#include <cstdint>
#include <string_view>

namespace vaultsync::crypto {

namespace {

class CanonicalWriter {
 public:
  explicit CanonicalWriter(std::string_view label) {
    Bytes(label);
  }

  CanonicalWriter& Bytes(std::string_view value) {
    U64(value.size());
    out_.append(value);
    return *this;
  }

  CanonicalWriter& U64(std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
      out_.push_back(static_cast<char>((value >> shift) & 0xFF));
    }
    return *this;
  }

  CanonicalWriter& I64(std::int64_t value) {
    return U64(static_cast<std::uint64_t>(value));
  }

  std::string Take() {
    return std::move(out_);
  }

 private:
  std::string out_;
};

void WriteToken(CanonicalWriter& w, const vaultsync::core::v1::DeviceToken& token) {
  w.Bytes(token.device_id())
      .Bytes(token.signing_public())
      .Bytes(token.encryption_public())
      .U64(token.key_epoch())
      .I64(token.issued_at_ms())
      .Bytes(token.vault_id());
}

} // namespace

std::string CanonicalBytes(const vaultsync::core::v1::DeviceToken& token) {
  CanonicalWriter w("vaultsync/device-token/v1");
  WriteToken(w, token);
  return w.Take();
}

std::string CanonicalBytes(const vaultsync::core::v1::DeviceAssertion& assertion) {
  CanonicalWriter w("vaultsync/device-assertion/v1");
  WriteToken(w, assertion.subject());
  w.Bytes(assertion.subject().signature());
  w.Bytes(assertion.introducer());
  return w.Take();
}

std::string CanonicalBytes(const vaultsync::core::v1::RevocationAssertion& revocation) {
  CanonicalWriter w("vaultsync/revocation/v1");
  w.Bytes(revocation.revoked_device_id()).U64(revocation.cutoff_clock()).Bytes(revocation.issuer()).I64(revocation.issued_at_ms());
  return w.Take();
}

std::string CanonicalBytes(const vaultsync::core::v1::KeyRotation& rotation) {
  CanonicalWriter w("vaultsync/key-rotation/v1");
  w.Bytes(rotation.device_id()).Bytes(rotation.encryption_public()).U64(rotation.key_epoch());
  return w.Take();
}

std::string CanonicalBytes(const vaultsync::wire::v1::SealedBatch& batch) {
  CanonicalWriter w("vaultsync/sealed-batch/v1");
  w.Bytes(batch.sender_id()).Bytes(batch.recipient_id()).U64(batch.sequence_no()).Bytes(batch.ciphertext());
  return w.Take();
}

bool VerifyDeviceToken(const vaultsync::core::v1::DeviceToken& token) {
  if (token.signing_public().size() != kKeySize || token.encryption_public().size() != kKeySize) {
    return false;
  }
  if (Fingerprint(token.signing_public()) != token.device_id()) {
    return false;
  }
  return VerifyMessage(token, token.signing_public());
}

} // namespace vaultsync::crypto
