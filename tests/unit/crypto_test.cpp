#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/crypto/device_identity.hpp"
#include "internal/crypto/key_store.hpp"
#include "internal/crypto/sealer.hpp"
#include "internal/crypto/signatures.hpp"
#include "internal/session/envelope.hpp"
#include "internal/util/errors.hpp"

namespace {

using vaultsync::crypto::DeviceIdentity;
using vaultsync::crypto::Sealer;
using vaultsync::session::EnvelopeCodec;
using vaultsync::util::AuthenticationFailure;

template <typename Fn>
bool ThrowsAuthFailure(Fn&& fn) {
  try {
    fn();
  } catch (const AuthenticationFailure&) {
    return true;
  }
  return false;
}

vaultsync::model::DeviceEntry EntryFor(const DeviceIdentity& identity) {
  vaultsync::model::DeviceEntry entry;
  entry.device_id         = identity.device_id();
  entry.signing_public    = identity.signing().public_key;
  entry.encryption_public = identity.encryption().public_key;
  entry.key_epoch         = identity.key_epoch();
  entry.trust             = vaultsync::model::TrustState::kTrusted;
  return entry;
}

void TestSealOpenBetweenDevices() {
  auto   alice = DeviceIdentity::Generate();
  auto   bob   = DeviceIdentity::Generate();
  Sealer sealer;

  const std::string plaintext = "balance=100.00 EUR";
  auto              sealed    = sealer.Seal(plaintext, bob.encryption().public_key, alice.encryption());
  assert(sealed.find(plaintext) == std::string::npos);
  assert(sealer.Open(sealed, alice.encryption().public_key, bob.encryption()) == plaintext);
}

void TestTamperedCiphertextIsRejected() {
  auto   alice = DeviceIdentity::Generate();
  auto   bob   = DeviceIdentity::Generate();
  Sealer sealer;

  auto sealed = sealer.Seal("memo: rent", bob.encryption().public_key, alice.encryption());
  for (std::size_t pos : {std::size_t{0}, std::size_t{5}, sealed.size() / 2, sealed.size() - 1}) {
    auto tampered = sealed;
    tampered[pos] = static_cast<char>(tampered[pos] ^ 0x01);
    assert(ThrowsAuthFailure([&] { sealer.Open(tampered, alice.encryption().public_key, bob.encryption()); }));
  }
  assert(ThrowsAuthFailure([&] { sealer.Open(sealed.substr(0, 10), alice.encryption().public_key, bob.encryption()); }));
}

void TestWrongRecipientCannotOpen() {
  auto   alice   = DeviceIdentity::Generate();
  auto   bob     = DeviceIdentity::Generate();
  auto   mallory = DeviceIdentity::Generate();
  Sealer sealer;

  auto sealed = sealer.Seal("secret", bob.encryption().public_key, alice.encryption());
  assert(ThrowsAuthFailure([&] { sealer.Open(sealed, alice.encryption().public_key, mallory.encryption()); }));
}

void TestPaddingHidesLength() {
  auto   alice = DeviceIdentity::Generate();
  auto   bob   = DeviceIdentity::Generate();
  Sealer sealer(64);

  auto short_msg = sealer.Seal("a", bob.encryption().public_key, alice.encryption());
  auto long_msg  = sealer.Seal(std::string(50, 'x'), bob.encryption().public_key, alice.encryption());
  assert(short_msg.size() == long_msg.size());

  auto bigger = sealer.Seal(std::string(70, 'x'), bob.encryption().public_key, alice.encryption());
  assert(bigger.size() == short_msg.size() + 64);
}

void TestDeviceTokenSignature() {
  auto identity = DeviceIdentity::Generate();
  auto token    = identity.MakeToken("vault-1", 1'000);
  assert(vaultsync::crypto::VerifyDeviceToken(token));
  assert(token.device_id() == vaultsync::crypto::Fingerprint(token.signing_public()));

  auto forged = token;
  forged.set_vault_id("vault-2");
  assert(!vaultsync::crypto::VerifyDeviceToken(forged));

  auto other          = DeviceIdentity::Generate();
  auto swapped_signer = token;
  swapped_signer.set_signing_public(other.signing().public_key);
  assert(!vaultsync::crypto::VerifyDeviceToken(swapped_signer));
}

void TestEnvelopeSignatureCoversAddressing() {
  auto alice = std::make_shared<DeviceIdentity>(DeviceIdentity::Generate());
  auto bob   = std::make_shared<DeviceIdentity>(DeviceIdentity::Generate());

  EnvelopeCodec alice_codec(alice, Sealer{});
  EnvelopeCodec bob_codec(bob, Sealer{});

  vaultsync::wire::v1::SyncMessage message;
  message.mutable_ack()->set_session_id("s-1");

  auto batch  = alice_codec.Seal(message, EntryFor(*bob), 7);
  auto opened = bob_codec.Open(batch, EntryFor(*alice));
  assert(opened.opened_with_current_key);
  assert(opened.message.ack().session_id() == "s-1");

  auto resequenced = batch;
  resequenced.set_sequence_no(8);
  assert(ThrowsAuthFailure([&] { bob_codec.Open(resequenced, EntryFor(*alice)); }));

  auto rebodied = batch;
  rebodied.set_ciphertext(batch.ciphertext() + "x");
  assert(ThrowsAuthFailure([&] { bob_codec.Open(rebodied, EntryFor(*alice)); }));
}

void TestRotationKeepsPreviousKeyForOneEpoch() {
  auto alice = std::make_shared<DeviceIdentity>(DeviceIdentity::Generate());
  auto bob   = std::make_shared<DeviceIdentity>(DeviceIdentity::Generate());

  EnvelopeCodec alice_codec(alice, Sealer{});
  EnvelopeCodec bob_codec(bob, Sealer{});

  const auto stale_bob = EntryFor(*bob);
  auto       rotation  = bob->RotateEncryptionKey();
  assert(rotation.key_epoch() == 2);
  assert(vaultsync::crypto::VerifyMessage(rotation, bob->signing().public_key));

  vaultsync::wire::v1::SyncMessage message;
  message.mutable_abort()->set_reason("test");

  // Alice has not learned the rotation and still seals to the old key.
  auto opened = bob_codec.Open(alice_codec.Seal(message, stale_bob, 1), EntryFor(*alice));
  assert(!opened.opened_with_current_key);

  // Bob seals with the previous pair for a peer that holds the old public key.
  auto batch = bob_codec.Seal(message, EntryFor(*alice), 2, true);
  assert(alice_codec.Open(batch, stale_bob).message.abort().reason() == "test");

  // Still opens once Alice has applied the rotation.
  auto rotated_bob                       = EntryFor(*bob);
  rotated_bob.previous_encryption_public = stale_bob.encryption_public;
  assert(alice_codec.Open(batch, rotated_bob).message.abort().reason() == "test");
  assert(ThrowsAuthFailure([&] { alice_codec.Open(batch, EntryFor(*bob)); }));

  // After a second rotation the oldest key is gone.
  bob->RotateEncryptionKey();
  assert(ThrowsAuthFailure([&] { bob_codec.Open(alice_codec.Seal(message, stale_bob, 3), EntryFor(*alice)); }));
}

void TestFileKeyStoreRoundTrip() {
  const auto dir  = std::filesystem::temp_directory_path() / "vaultsync_crypto_test";
  const auto path = dir / "device.key";
  std::filesystem::remove_all(dir);

  vaultsync::crypto::FileKeyStore store(path.string());
  assert(!store.Load().has_value());

  auto created = DeviceIdentity::LoadOrCreate(store);
  created.RotateEncryptionKey();
  store.Save(created.ToKeyMaterial());

  auto loaded = DeviceIdentity::LoadOrCreate(store);
  assert(loaded.device_id() == created.device_id());
  assert(loaded.key_epoch() == 2);
  assert(loaded.encryption().public_key == created.encryption().public_key);
  assert(loaded.previous_encryption().has_value());

  const auto perms = std::filesystem::status(path).permissions();
  assert((perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all)) == std::filesystem::perms::none);
  std::filesystem::remove_all(dir);
}

} // namespace

int main() {
  TestSealOpenBetweenDevices();
  TestTamperedCiphertextIsRejected();
  TestWrongRecipientCannotOpen();
  TestPaddingHidesLength();
  TestDeviceTokenSignature();
  TestEnvelopeSignatureCoversAddressing();
  TestRotationKeepsPreviousKeyForOneEpoch();
  TestFileKeyStoreRoundTrip();

  std::cout << "vaultsync_unit_crypto: pass\n";
  return 0;
}
