#include "internal/relay/relay_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/transport/relay_transport.hpp"
#include "internal/util/errors.hpp"

namespace {

using vaultsync::relay::RelayLimits;
using vaultsync::relay::RelayStore;
using vaultsync::wire::v1::SealedBatch;

SealedBatch MakeBatch(const std::string& from, const std::string& to, std::uint64_t seq, std::size_t size = 16) {
  SealedBatch batch;
  batch.set_sender_id(from);
  batch.set_recipient_id(to);
  batch.set_sequence_no(seq);
  batch.set_ciphertext(std::string(size, 'c'));
  return batch;
}

template <typename Fn>
bool Rejected(Fn&& fn) {
  try {
    fn();
  } catch (const vaultsync::util::RelayRejected&) {
    return true;
  }
  return false;
}

void TestFetchDrainsInOrder() {
  RelayStore store;
  store.Put(MakeBatch("a", "b", 1));
  store.Put(MakeBatch("a", "b", 2));
  store.Put(MakeBatch("a", "b", 3));
  store.Put(MakeBatch("b", "a", 1));

  assert(store.Queued("b") == 3);
  assert(store.TotalQueued() == 4);

  auto first = store.Fetch("b", 2);
  assert(first.size() == 2);
  assert(first[0].sequence_no() == 1 && first[1].sequence_no() == 2);
  assert(store.Fetch("b", 0).size() == 1);
  assert(store.Queued("b") == 0);
  assert(store.Fetch("nobody", 10).empty());
}

void TestLimits() {
  RelayLimits limits;
  limits.mailbox_capacity = 2;
  limits.max_batch_bytes  = 128;
  RelayStore store(limits);

  assert(Rejected([&] { store.Put(MakeBatch("a", "", 1)); }));
  assert(Rejected([&] { store.Put(MakeBatch("a", "b", 1, 512)); }));

  store.Put(MakeBatch("a", "b", 1));
  store.Put(MakeBatch("a", "b", 2));
  assert(Rejected([&] { store.Put(MakeBatch("a", "b", 3)); }));

  // Other mailboxes are unaffected.
  store.Put(MakeBatch("a", "c", 1));
  assert(store.TotalQueued() == 3);
}

void TestRelayTransportOverStore() {
  auto store = std::make_shared<RelayStore>();
  vaultsync::transport::RelayTransport alice(store, "alice", 1);
  vaultsync::transport::RelayTransport bob(store, "bob", 1);

  alice.Send("bob", MakeBatch("alice", "bob", 1));
  alice.Send("bob", MakeBatch("alice", "bob", 2));

  bool threw = false;
  try {
    alice.Send("carol", MakeBatch("alice", "bob", 3));
  } catch (const vaultsync::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  auto one = bob.Receive();
  auto two = bob.Receive();
  assert(one && one->sequence_no() == 1);
  assert(two && two->sequence_no() == 2);
  assert(!bob.Receive().has_value());
  assert(!alice.Receive().has_value());
}

} // namespace

int main() {
  TestFetchDrainsInOrder();
  TestLimits();
  TestRelayTransportOverStore();

  std::cout << "vaultsync_unit_relay_store: pass\n";
  return 0;
}
