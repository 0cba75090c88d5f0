#include "envelope.hpp"

#include <utility>
#include <vector>

#include "internal/crypto/signatures.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/secure_bytes.hpp"

namespace vaultsync::session {

namespace v1 = vaultsync::wire::v1;

EnvelopeCodec::EnvelopeCodec(std::shared_ptr<const crypto::DeviceIdentity> identity, crypto::Sealer sealer)
    : identity_(std::move(identity)), sealer_(sealer) {
}

v1::SealedBatch EnvelopeCodec::Seal(const v1::SyncMessage& message, const model::DeviceEntry& recipient, std::uint64_t sequence_no,
                                    bool use_previous_key) const {
  std::string plaintext;
  if (!message.SerializeToString(&plaintext)) {
    throw util::InvalidState("failed to serialize sync message");
  }

  const auto& sender_keys = (use_previous_key && identity_->previous_encryption()) ? *identity_->previous_encryption() : identity_->encryption();

  v1::SealedBatch batch;
  batch.set_sender_id(identity_->device_id());
  batch.set_recipient_id(recipient.device_id);
  batch.set_sequence_no(sequence_no);
  batch.set_ciphertext(sealer_.Seal(plaintext, recipient.encryption_public, sender_keys));
  util::SecureWipe(plaintext);

  crypto::SignMessage(&batch, identity_->signing().private_key);
  return batch;
}

OpenedMessage EnvelopeCodec::Open(const v1::SealedBatch& batch, const model::DeviceEntry& sender) const {
  if (batch.sender_id() != sender.device_id || batch.recipient_id() != identity_->device_id()) {
    throw util::AuthenticationFailure("envelope addressed from " + batch.sender_id() + " to " + batch.recipient_id());
  }
  if (!crypto::VerifyMessage(batch, sender.signing_public)) {
    throw util::AuthenticationFailure("envelope signature invalid from " + sender.device_id);
  }

  // Either side may have rotated since the other last heard from it: try our
  // current key first, then the key pair each side held before its rotation.
  std::vector<std::pair<const crypto::KeyPair*, const std::string*>> attempts;
  attempts.emplace_back(&identity_->encryption(), &sender.encryption_public);
  if (!sender.previous_encryption_public.empty()) {
    attempts.emplace_back(&identity_->encryption(), &sender.previous_encryption_public);
  }
  if (identity_->previous_encryption()) {
    attempts.emplace_back(&*identity_->previous_encryption(), &sender.encryption_public);
    if (!sender.previous_encryption_public.empty()) {
      attempts.emplace_back(&*identity_->previous_encryption(), &sender.previous_encryption_public);
    }
  }

  OpenedMessage opened;
  std::string   plaintext;
  for (std::size_t i = 0; i < attempts.size(); ++i) {
    try {
      plaintext                      = sealer_.Open(batch.ciphertext(), *attempts[i].second, *attempts[i].first);
      opened.opened_with_current_key = attempts[i].first == &identity_->encryption();
      break;
    } catch (const util::AuthenticationFailure&) {
      if (i + 1 == attempts.size()) {
        throw;
      }
    }
  }

  const bool parsed = opened.message.ParseFromString(plaintext);
  util::SecureWipe(plaintext);
  if (!parsed) {
    throw util::InvalidState("malformed sync message from " + sender.device_id);
  }
  return opened;
}

} // namespace vaultsync::session
