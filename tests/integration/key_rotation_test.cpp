#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/transport/memory_network.hpp"
#include "sync_harness.hpp"

namespace {

using vaultsync::crypto::DeviceIdentity;
using vaultsync::model::SessionState;
using vaultsync::testing::Device;
using vaultsync::testing::FakeClock;
using vaultsync::testing::MakeDevice;
using vaultsync::testing::PairAll;
using vaultsync::testing::PumpRound;
using vaultsync::testing::Quiesce;
using vaultsync::testing::Settle;
using vaultsync::transport::MemoryNetwork;

struct Pair {
  FakeClock                      clock;
  std::shared_ptr<MemoryNetwork> network = std::make_shared<MemoryNetwork>();
  std::vector<Device>            devices;

  Pair() {
    devices.reserve(2);
    for (int i = 0; i < 2; ++i) {
      auto identity = DeviceIdentity::Generate();
      auto link     = network->Attach(identity.device_id());
      devices.push_back(MakeDevice(identity, link, clock));
    }
    PairAll({&a(), &b()});
  }

  Device& a() {
    return devices[0];
  }
  Device& b() {
    return devices[1];
  }

  void SyncFrom(Device& initiator, Device& peer) {
    assert(initiator.engine->TriggerSync(peer.id()));
    assert(Quiesce({&initiator, &peer}, clock));
  }
};

bool Holds(Device& device, const std::string& entity, const std::string& field) {
  return device.engine->Snapshot(entity).fields.contains(field);
}

void TestRotationKeepsSyncFlowing() {
  Pair pair;
  auto& a = pair.a();
  auto& b = pair.b();

  a.engine->Append("acct", "before", std::string("old key"));
  pair.SyncFrom(a, b);
  assert(Holds(b, "acct", "before"));

  const auto rotation = a.engine->RotateEncryptionKey();
  assert(rotation.key_epoch() == 2);
  assert(rotation.device_id() == a.id());

  // The new key is what a restarted daemon would load.
  auto stored = a.key_store->Load();
  assert(stored.has_value());
  assert(DeviceIdentity::FromKeyMaterial(*stored).key_epoch() == 2);

  // b still holds the old public key; the first hello reaches it anyway and
  // carries the rotation.
  a.engine->Append("acct", "after", std::string("new key"));
  pair.SyncFrom(a, b);
  assert(Holds(b, "acct", "after"));

  auto entry = b.engine->registry()->Get(a.id());
  assert(entry.has_value());
  assert(entry->key_epoch == 2);
  assert(entry->encryption_public == rotation.encryption_public());

  b.engine->Append("acct", "reply", std::string("to the new key"));
  pair.SyncFrom(b, a);
  assert(Holds(a, "acct", "reply"));
  assert(a.engine->Status().peers[0].last_error.empty());
  assert(b.engine->Status().peers[0].last_error.empty());
}

void TestPeerStartsBeforeLearningRotation() {
  Pair pair;
  auto& a = pair.a();
  auto& b = pair.b();
  assert(Settle({&a, &b}, pair.clock));

  a.engine->RotateEncryptionKey();
  a.engine->Append("budget", "limit", std::int64_t{1200});
  b.engine->Append("budget", "note", std::string("groceries"));

  // b seals to a's old key; a answers under its old key in the same exchange
  // that tells b about the new one.
  pair.SyncFrom(b, a);
  assert(Holds(a, "budget", "note"));
  assert(Holds(b, "budget", "limit"));
  assert(b.engine->registry()->Get(a.id())->key_epoch == 2);

  assert(b.engine->Status().peers[0].session_state == SessionState::kReconciled);
  assert(a.engine->Status().peers[0].session_state == SessionState::kReconciled);
}

void TestTwoRotationsRequirePairingAgain() {
  Pair pair;
  auto& a = pair.a();
  auto& b = pair.b();
  assert(Settle({&a, &b}, pair.clock));

  // b is away for two rotations; the key it knows is gone from a.
  a.engine->RotateEncryptionKey();
  a.engine->RotateEncryptionKey();
  a.engine->Append("acct", "memo", std::string("after two rotations"));

  assert(a.engine->TriggerSync(b.id()));
  for (int round = 0; round < 600; ++round) {
    PumpRound({&a, &b}, pair.clock);
  }
  assert(!Holds(b, "acct", "memo"));
  assert(b.engine->registry()->Get(a.id())->key_epoch == 1);
  assert(a.engine->Status().peers[0].session_state == SessionState::kFailed);
  assert(!a.engine->Status().peers[0].last_error.empty());

  // A fresh token carries the current key and restores the link.
  auto entry = b.engine->Pair(a.engine->DeviceToken());
  assert(entry.key_epoch == 3);
  assert(b.engine->TriggerSync(a.id()));
  assert(Settle({&a, &b}, pair.clock, 0));
  assert(Holds(b, "acct", "memo"));
  assert(a.engine->Status().peers[0].pending_records == 0);
}

} // namespace

int main() {
  TestRotationKeepsSyncFlowing();
  TestPeerStartsBeforeLearningRotation();
  TestTwoRotationsRequirePairingAgain();

  std::cout << "vaultsync_integration_key_rotation: pass\n";
  return 0;
}
