#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "internal/transport/memory_network.hpp"
#include "internal/transport/transport.hpp"
#include "sync_harness.hpp"

namespace {

using vaultsync::crypto::DeviceIdentity;
using vaultsync::model::FieldValue;
using vaultsync::model::Money;
using vaultsync::model::SessionState;
using vaultsync::testing::Device;
using vaultsync::testing::FakeClock;
using vaultsync::testing::MakeDevice;
using vaultsync::testing::PairAll;
using vaultsync::testing::Settle;
using vaultsync::transport::MemoryNetwork;
using vaultsync::transport::Transport;
using vaultsync::wire::v1::SealedBatch;

struct World {
  FakeClock                      clock;
  std::shared_ptr<MemoryNetwork> network = std::make_shared<MemoryNetwork>();
  std::vector<Device>            devices;

  explicit World(std::size_t count) {
    devices.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
      auto identity = DeviceIdentity::Generate();
      auto link     = network->Attach(identity.device_id());
      devices.push_back(MakeDevice(identity, link, clock));
    }
    PairAll(all());
  }

  std::vector<Device*> all() {
    std::vector<Device*> out;
    for (auto& device : devices) out.push_back(&device);
    return out;
  }

  bool Settle(int trigger_every = 10) {
    return vaultsync::testing::Settle(all(), clock, trigger_every);
  }
};

std::int64_t Units(const vaultsync::model::EntitySnapshot& snapshot, const std::string& field) {
  return std::get<Money>(snapshot.fields.at(field)).units;
}

void TestLaterConcurrentWriteWinsEverywhere() {
  World world(2);
  auto& phone  = world.devices[0];
  auto& laptop = world.devices[1];

  world.clock.Set(1'700'000'090'000);
  phone.engine->Append("checking", "balance", Money{9000, 2, "USD"});
  world.clock.Set(1'700'000'100'000);
  laptop.engine->Append("checking", "balance", Money{10000, 2, "USD"});

  assert(world.Settle());
  assert(Units(phone.engine->Snapshot("checking"), "balance") == 10000);
  assert(Units(laptop.engine->Snapshot("checking"), "balance") == 10000);
  assert(phone.engine->Status().record_count == 2);
}

void TestConcurrentDeleteAgainstEdit() {
  {
    World world(2);
    auto& a = world.devices[0];
    auto& b = world.devices[1];
    a.engine->Append("txn-7", "memo", std::string("lunch"));
    assert(world.Settle());

    // Delete carries the later hint; the entity is gone on both sides.
    world.clock.Advance(std::chrono::seconds(5));
    b.engine->Append("txn-7", "memo", std::string("team lunch"));
    world.clock.Advance(std::chrono::seconds(5));
    a.engine->Delete("txn-7");

    assert(world.Settle());
    assert(a.engine->Snapshot("txn-7").deleted);
    assert(b.engine->Snapshot("txn-7").deleted);
    assert(b.engine->Snapshot("txn-7").fields.empty());
  }
  {
    World world(2);
    auto& a = world.devices[0];
    auto& b = world.devices[1];
    a.engine->Append("txn-8", "memo", std::string("taxi"));
    assert(world.Settle());

    // The edit carries the later hint and keeps the entity alive.
    world.clock.Advance(std::chrono::seconds(5));
    a.engine->Delete("txn-8");
    world.clock.Advance(std::chrono::seconds(5));
    b.engine->Append("txn-8", "memo", std::string("airport taxi"));

    assert(world.Settle());
    for (auto* device : world.all()) {
      const auto snapshot = device->engine->Snapshot("txn-8");
      assert(!snapshot.deleted);
      assert(std::get<std::string>(snapshot.fields.at("memo")) == "airport taxi");
    }
  }
}

void TestCausalSuccessorBeatsLaterTimestamp() {
  World world(2);
  auto& a = world.devices[0];
  auto& b = world.devices[1];

  // a's clock runs far ahead of b's.
  world.clock.Set(1'800'000'000'000);
  a.engine->Append("budget", "limit", std::int64_t{500});
  assert(world.Settle());

  world.clock.Set(1'700'000'000'000);
  b.engine->Append("budget", "limit", std::int64_t{650});
  assert(world.Settle());

  assert(std::get<std::int64_t>(a.engine->Snapshot("budget").fields.at("limit")) == 650);
  assert(std::get<std::int64_t>(b.engine->Snapshot("budget").fields.at("limit")) == 650);
}

void TestRandomEditsConverge() {
  World        world(3);
  std::mt19937 rng(20240917);

  const std::vector<std::string> entities = {"acct-1", "acct-2", "txn-1", "txn-2", "budget"};
  const std::vector<std::string> fields   = {"memo", "amount", "category"};

  for (int round = 0; round < 4; ++round) {
    for (int i = 0; i < 12; ++i) {
      auto&       device = world.devices[rng() % world.devices.size()];
      const auto& entity = entities[rng() % entities.size()];
      world.clock.Advance(std::chrono::milliseconds(1 + rng() % 5));
      switch (rng() % 5) {
        case 0:
          device.engine->Delete(entity);
          break;
        case 1:
          device.engine->Append(entity, fields[rng() % fields.size()], Money{static_cast<std::int64_t>(rng() % 100000), 2, "EUR"});
          break;
        default:
          device.engine->Append(entity, fields[rng() % fields.size()], std::string("v") + std::to_string(rng() % 1000));
          break;
      }
    }
    // Partial syncs between rounds: only one device reaches out.
    world.devices[static_cast<std::size_t>(round) % world.devices.size()].engine->TriggerSync();
    for (int pump = 0; pump < 6; ++pump) {
      for (auto& device : world.devices) device.engine->Pump();
    }
  }

  assert(world.Settle());
  for (const auto& entity : entities) {
    const auto expected = world.devices[0].engine->Snapshot(entity);
    for (auto& device : world.devices) {
      assert(device.engine->Snapshot(entity) == expected);
    }
  }
  for (auto& device : world.devices) {
    assert(device.engine->change_log()->PendingCount() == 0);
  }
}

void TestCancelLeavesLogUntouched() {
  World world(2);
  auto& a = world.devices[0];
  auto& b = world.devices[1];

  a.engine->Append("acct", "memo", std::string("local"));
  b.engine->Append("acct", "category", std::string("remote"));

  const auto rows_before = [&] {
    auto tx   = a.repository->Begin();
    auto rows = a.repository->ListRecords(*tx);
    tx->Commit();
    return rows;
  };
  const auto before          = rows_before();
  const auto records_before  = a.engine->change_log()->Records();
  const auto snapshot_before = a.engine->Snapshot("acct");

  // a stages b's records, then cancels before b acknowledges.
  assert(a.engine->TriggerSync(b.id()));
  b.engine->Pump();
  a.engine->Pump();
  assert(a.engine->Status().peers[0].session_state == SessionState::kExchanging);

  assert(a.engine->Cancel(b.id()));
  assert(a.engine->Status().peers[0].session_state == SessionState::kIdle);
  assert(a.engine->Status().peers[0].last_error == "cancelled");
  assert(rows_before() == before);
  assert(a.engine->change_log()->Records() == records_before);
  assert(a.engine->Snapshot("acct") == snapshot_before);
  assert(!a.engine->Cancel(b.id()));

  // Late replies for the cancelled session change nothing either.
  b.engine->Pump();
  a.engine->Pump();
  assert(rows_before() == before);

  assert(world.Settle());
  assert(a.engine->Snapshot("acct").fields.size() == 2);
}

void TestUnreachablePeerBacksOffThenFails() {
  World world(2);
  auto& a = world.devices[0];
  auto& b = world.devices[1];

  a.engine->Append("acct", "memo", std::string("offline edit"));
  world.network->SetReachable(b.id(), false);

  assert(a.engine->TriggerSync(b.id()));
  for (int i = 0; i < 200; ++i) {
    a.engine->Pump();
    world.clock.Advance(std::chrono::milliseconds(100));
  }

  auto status = a.engine->Status();
  assert(status.peers.size() == 1);
  assert(status.peers[0].session_state == SessionState::kFailed);
  assert(!status.peers[0].last_error.empty());
  assert(status.peers[0].pending_records == 1);
  assert(world.network->Queued(b.id()) == 0);

  // Budget spent: nothing is retried on its own.
  for (int i = 0; i < 50; ++i) {
    a.engine->Pump();
    world.clock.Advance(std::chrono::seconds(1));
  }
  assert(a.engine->Status().peers[0].session_state == SessionState::kFailed);

  world.network->SetReachable(b.id(), true);
  assert(a.engine->TriggerSync(b.id()) == true);
  assert(world.Settle(0));
  assert(std::get<std::string>(b.engine->Snapshot("acct").fields.at("memo")) == "offline edit");
  assert(a.engine->Status().peers[0].pending_records == 0);
  assert(a.engine->Status().peers[0].last_error.empty());
}

void TestDuplicateDeliveryIsHarmless() {
  World world(2);
  auto& a = world.devices[0];
  auto& b = world.devices[1];

  a.engine->Append("acct", "memo", std::string("once"));
  assert(world.Settle());
  const auto count = b.engine->Status().record_count;

  // A second full round over the same data adds nothing.
  assert(world.Settle());
  assert(b.engine->Status().record_count == count);
  assert(a.engine->Status().record_count == count);
}

// Hands every inbound batch over twice; the second copy carries a broken
// signature.
class EchoingTransport final : public Transport {
 public:
  explicit EchoingTransport(std::shared_ptr<Transport> inner) : inner_(std::move(inner)) {
  }

  void Send(const std::string& peer_id, const SealedBatch& batch) override {
    inner_->Send(peer_id, batch);
  }

  std::optional<SealedBatch> Receive() override {
    if (echo_) {
      auto batch = std::move(*echo_);
      echo_.reset();
      return batch;
    }
    auto batch = inner_->Receive();
    if (batch && !batch->signature().empty()) {
      echo_ = *batch;
      echo_->mutable_signature()->back() ^= 0x01;
      ++echoed;
    }
    return batch;
  }

  int echoed = 0;

 private:
  std::shared_ptr<Transport> inner_;
  std::optional<SealedBatch> echo_;
};

void TestResentSequenceDroppedBeforeOpening() {
  FakeClock clock;
  auto      network = std::make_shared<MemoryNetwork>();

  auto a_identity = DeviceIdentity::Generate();
  auto b_identity = DeviceIdentity::Generate();
  auto b_link     = std::make_shared<EchoingTransport>(network->Attach(b_identity.device_id()));
  auto a          = MakeDevice(a_identity, network->Attach(a_identity.device_id()), clock);
  auto b          = MakeDevice(b_identity, b_link, clock);
  PairAll({&a, &b});

  a.engine->Append("acct", "memo", std::string("sent once"));
  assert(a.engine->TriggerSync(b.id()));
  for (int round = 0; round < 40; ++round) {
    vaultsync::testing::PumpRound({&a, &b}, clock);
    // The damaged copy reuses a sequence b already took, so it never reaches
    // signature verification and never fails the exchange.
    assert(a.engine->Status().peers[0].last_error.empty());
    assert(b.engine->Status().peers[0].last_error.empty());
  }

  assert(b_link->echoed > 0);
  assert(b.engine->Snapshot("acct").fields.contains("memo"));
  assert(a.engine->Status().peers[0].session_state == SessionState::kReconciled);
  assert(b.engine->Status().peers[0].session_state == SessionState::kReconciled);
}

} // namespace

int main() {
  TestLaterConcurrentWriteWinsEverywhere();
  TestConcurrentDeleteAgainstEdit();
  TestCausalSuccessorBeatsLaterTimestamp();
  TestRandomEditsConverge();
  TestCancelLeavesLogUntouched();
  TestUnreachablePeerBacksOffThenFails();
  TestDuplicateDeliveryIsHarmless();
  TestResentSequenceDroppedBeforeOpening();

  std::cout << "vaultsync_integration_sync_convergence: pass\n";
  return 0;
}
