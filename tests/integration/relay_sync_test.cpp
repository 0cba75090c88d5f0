#include <algorithm>
#include <cassert>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "internal/relay/relay_store.hpp"
#include "internal/transport/memory_network.hpp"
#include "internal/transport/relay_transport.hpp"
#include "sync_harness.hpp"

namespace {

using vaultsync::crypto::DeviceIdentity;
using vaultsync::model::EntitySnapshot;
using vaultsync::model::Money;
using vaultsync::testing::Device;
using vaultsync::testing::FakeClock;
using vaultsync::testing::MakeDevice;
using vaultsync::testing::PairAll;
using vaultsync::testing::Settle;
using vaultsync::wire::v1::SealedBatch;

/*
  Relay that reorders, duplicates and delays what it forwards. It never
  loses a batch: a mailbox holding a single batch always hands it out.
*/
class ChaoticRelay final : public vaultsync::transport::RelayEndpoint {
 public:
  explicit ChaoticRelay(std::uint32_t seed) : rng_(seed) {
  }

  void Put(const SealedBatch& batch) override {
    inner_.Put(batch);
    if (rng_() % 3 == 0) {
      inner_.Put(batch);
      ++duplicated_;
    }
  }

  std::vector<SealedBatch> Fetch(const std::string& recipient_id, std::uint32_t max_batches) override {
    auto& held  = held_[recipient_id];
    auto  fresh = inner_.Fetch(recipient_id, max_batches);
    held.insert(held.end(), fresh.begin(), fresh.end());
    std::shuffle(held.begin(), held.end(), rng_);

    std::vector<SealedBatch> out;
    if (held.size() >= 2 && rng_() % 4 == 0) {
      out.assign(held.begin(), held.end() - 1);
      held.erase(held.begin(), held.end() - 1);
      ++delayed_;
    } else {
      out.swap(held);
    }
    return out;
  }

  std::size_t duplicated() const {
    return duplicated_;
  }
  std::size_t delayed() const {
    return delayed_;
  }

 private:
  vaultsync::relay::RelayStore                    inner_;
  std::mt19937                                    rng_;
  std::map<std::string, std::vector<SealedBatch>> held_;
  std::size_t                                     duplicated_ = 0;
  std::size_t                                     delayed_    = 0;
};

struct World {
  FakeClock           clock;
  std::vector<Device> devices;

  using LinkFn = std::function<std::shared_ptr<vaultsync::transport::Transport>(const std::string&)>;

  World(const std::vector<DeviceIdentity>& identities, const LinkFn& link) {
    devices.reserve(identities.size());
    for (const auto& identity : identities) {
      devices.push_back(MakeDevice(identity, link(identity.device_id()), clock));
    }
    PairAll(all());
  }

  std::vector<Device*> all() {
    std::vector<Device*> out;
    for (auto& device : devices) out.push_back(&device);
    return out;
  }
};

const std::vector<std::string> kEntities = {"checking", "savings", "txn-1", "txn-2"};

// The same edits, in the same wall clock order, for every world.
void RunScript(World& world) {
  auto& a = world.devices[0];
  auto& b = world.devices[1];
  auto& c = world.devices[2];

  world.clock.Set(1'700'000'001'000);
  a.engine->Append("checking", "balance", Money{10000, 2, "USD"});
  world.clock.Set(1'700'000'001'100);
  b.engine->Append("checking", "balance", Money{9000, 2, "USD"});
  world.clock.Set(1'700'000'001'200);
  c.engine->Append("savings", "balance", Money{250000, 2, "USD"});
  world.clock.Set(1'700'000'001'250);
  b.engine->Append("txn-1", "memo", std::string("groceries"));
  world.clock.Set(1'700'000'001'300);
  a.engine->Delete("txn-1");
  world.clock.Set(1'700'000'001'400);
  c.engine->Append("txn-2", "memo", std::string("rent"));
  assert(Settle(world.all(), world.clock));

  world.clock.Set(1'700'000'100'000);
  c.engine->Append("checking", "balance", Money{9500, 2, "USD"});
  world.clock.Set(1'700'000'100'100);
  a.engine->Append("txn-2", "category", std::string("housing"));
  b.engine->Append("savings", "memo", std::string("emergency fund"));
  assert(Settle(world.all(), world.clock));
}

std::map<std::string, EntitySnapshot> Snapshots(Device& device) {
  std::map<std::string, EntitySnapshot> out;
  for (const auto& entity : kEntities) {
    out[entity] = device.engine->Snapshot(entity);
  }
  return out;
}

void TestChaoticRelayMatchesCleanSync() {
  std::vector<DeviceIdentity> identities;
  for (int i = 0; i < 3; ++i) identities.push_back(DeviceIdentity::Generate());

  auto network = std::make_shared<vaultsync::transport::MemoryNetwork>();
  World clean(identities, [&](const std::string& id) { return network->Attach(id); });
  RunScript(clean);

  auto  relay = std::make_shared<ChaoticRelay>(7);
  World chaotic(identities, [&](const std::string& id) { return std::make_shared<vaultsync::transport::RelayTransport>(relay, id, 8); });
  RunScript(chaotic);

  assert(relay->duplicated() > 0);
  assert(relay->delayed() > 0);

  const auto expected = Snapshots(clean.devices[0]);
  for (auto& device : clean.devices) assert(Snapshots(device) == expected);
  for (auto& device : chaotic.devices) assert(Snapshots(device) == expected);

  assert(std::get<Money>(expected.at("checking").fields.at("balance")).units == 9500);
  assert(expected.at("txn-1").deleted);
  assert(std::get<std::string>(expected.at("txn-2").fields.at("category")) == "housing");
  assert(expected.at("savings").fields.size() == 2);

  for (auto& device : chaotic.devices) {
    assert(device.engine->change_log()->PendingCount() == 0);
    assert(device.engine->Status().record_count == 9);
  }
}

void TestRelayOnlySeesCiphertext() {
  auto store = std::make_shared<vaultsync::relay::RelayStore>();

  FakeClock clock;
  auto      a_id = DeviceIdentity::Generate();
  auto      b_id = DeviceIdentity::Generate();
  auto      a    = MakeDevice(a_id, std::make_shared<vaultsync::transport::RelayTransport>(store, a_id.device_id()), clock);
  auto      b    = MakeDevice(b_id, std::make_shared<vaultsync::transport::RelayTransport>(store, b_id.device_id()), clock);
  PairAll({&a, &b});

  a.engine->Append("acct", "memo", std::string("confidential-memo-text"));
  assert(a.engine->TriggerSync(b.id()));
  b.engine->Pump();
  a.engine->Pump();
  assert(store->Queued(b.id()) >= 1);

  auto queued = store->Fetch(b.id(), 16);
  for (const auto& batch : queued) {
    assert(batch.sender_id() == a.id());
    assert(batch.ciphertext().find("confidential-memo-text") == std::string::npos);
  }
  // Put them back; the relay's copy is the only copy.
  for (const auto& batch : queued) store->Put(batch);

  assert(Settle({&a, &b}, clock, 0));
  assert(std::get<std::string>(b.engine->Snapshot("acct").fields.at("memo")) == "confidential-memo-text");
  assert(store->TotalQueued() == 0);
}

} // namespace

int main() {
  TestChaoticRelayMatchesCleanSync();
  TestRelayOnlySeesCiphertext();

  std::cout << "vaultsync_integration_relay_sync: pass\n";
  return 0;
}
