#pragma once

#include <string>

#include "internal/crypto/keys.hpp"
#include "vaultsync/core/v1/identity.pb.h"
#include "vaultsync/wire/v1/envelope.pb.h"

namespace vaultsync::crypto {

/*
  Domain-separated canonical byte strings for every signed structure.

  Each encoding starts with a distinct label and length-prefixes every field,
  so a signature over one kind of structure never verifies as another.
  Protobuf serialization is not used because it is not canonical.
*/

std::string CanonicalBytes(const vaultsync::core::v1::DeviceToken& token);
std::string CanonicalBytes(const vaultsync::core::v1::DeviceAssertion& assertion);
std::string CanonicalBytes(const vaultsync::core::v1::RevocationAssertion& revocation);
std::string CanonicalBytes(const vaultsync::core::v1::KeyRotation& rotation);
std::string CanonicalBytes(const vaultsync::wire::v1::SealedBatch& batch);

// Signs in place, overwriting the signature field.
template <typename Message>
void SignMessage(Message* message, const PrivateKey& signing_private) {
  message->clear_signature();
  message->set_signature(Sign(signing_private, CanonicalBytes(*message)));
}

template <typename Message>
bool VerifyMessage(const Message& message, const std::string& signing_public) {
  return Verify(signing_public, CanonicalBytes(message), message.signature());
}

// Self-signature valid and device_id matches the signing key fingerprint.
bool VerifyDeviceToken(const vaultsync::core::v1::DeviceToken& token);

} // namespace vaultsync::crypto
