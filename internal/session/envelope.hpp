#pragma once

#include <cstdint>
#include <memory>

#include "internal/crypto/device_identity.hpp"
#include "internal/crypto/sealer.hpp"
#include "internal/model/device.hpp"
#include "vaultsync/wire/v1/envelope.pb.h"

namespace vaultsync::session {

struct OpenedMessage {
  vaultsync::wire::v1::SyncMessage message;
  // False when only the previous encryption key opened it, i.e. the sender
  // has not learned our latest rotation yet.
  bool opened_with_current_key = true;
};

/*
  Seals protocol messages into signed envelopes and back.

  The envelope signature covers sender, recipient, sequence and ciphertext;
  it is checked before anything is decrypted.
*/
class EnvelopeCodec {
 public:
  EnvelopeCodec(std::shared_ptr<const crypto::DeviceIdentity> identity, crypto::Sealer sealer);

  // use_previous_key seals with the pre-rotation key pair, for peers that
  // still hold our old public key.
  vaultsync::wire::v1::SealedBatch Seal(const vaultsync::wire::v1::SyncMessage& message, const model::DeviceEntry& recipient,
                                        std::uint64_t sequence_no, bool use_previous_key = false) const;

  // Throws util::AuthenticationFailure on a bad signature or ciphertext.
  OpenedMessage Open(const vaultsync::wire::v1::SealedBatch& batch, const model::DeviceEntry& sender) const;

 private:
  std::shared_ptr<const crypto::DeviceIdentity> identity_;
  crypto::Sealer                                sealer_;
};

} // namespace vaultsync::session
