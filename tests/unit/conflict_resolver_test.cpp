#include "internal/resolver/conflict_resolver.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace {

using vaultsync::model::ChangeRecord;
using vaultsync::model::FieldValue;
using vaultsync::model::kLifecycleField;
using vaultsync::model::Money;
using vaultsync::model::Tombstone;
using vaultsync::model::VectorClock;
using vaultsync::resolver::ConflictResolver;

ChangeRecord MakeRecord(const std::string& device, std::uint64_t clock, std::int64_t wall_ms, const std::string& field, FieldValue value,
                        VectorClock deps = {}) {
  ChangeRecord record;
  record.record_id          = device + "-" + std::to_string(clock);
  record.entity_id          = "account-1";
  record.field_path         = field;
  record.value              = std::move(value);
  record.device_id          = device;
  record.logical_clock      = clock;
  record.wall_clock_hint_ms = wall_ms;
  record.causal_deps        = std::move(deps);
  return record;
}

Money Balance(std::int64_t units) {
  return Money{units, 2, "EUR"};
}

void TestConcurrentWritesPickLaterWallClock() {
  auto x = MakeRecord("device-x", 1, 2'000, "balance", Balance(100));
  auto y = MakeRecord("device-y", 1, 1'000, "balance", Balance(90));

  auto value = ConflictResolver::FoldField({x, y}, "balance");
  assert(value.has_value());
  assert(std::get<Money>(*value) == Balance(100));

  // Same answer regardless of which side folds.
  assert(ConflictResolver::FoldField({y, x}, "balance") == value);
}

void TestExactTimestampTieBreaksOnDeviceId() {
  auto x = MakeRecord("device-a", 1, 5'000, "balance", Balance(1));
  auto y = MakeRecord("device-b", 1, 5'000, "balance", Balance(2));

  auto value = ConflictResolver::FoldField({x, y}, "balance");
  assert(std::get<Money>(*value) == Balance(2));
  assert(ConflictResolver::LosesTieBreak(x, y));
  assert(!ConflictResolver::LosesTieBreak(y, x));
}

void TestCausalDescendantBeatsLaterTimestamp() {
  auto a = MakeRecord("device-x", 1, 9'000, "memo", std::string("first"));
  auto b = MakeRecord("device-y", 1, 1'000, "memo", std::string("edited"), VectorClock({{"device-x", 1}}));

  assert(ConflictResolver::HappensBefore(a, b));
  assert(!ConflictResolver::HappensBefore(b, a));
  auto value = ConflictResolver::FoldField({a, b}, "memo");
  assert(std::get<std::string>(*value) == "edited");
}

void TestSameDeviceOrderedByClock() {
  auto a = MakeRecord("device-x", 1, 9'000, "memo", std::string("old"));
  auto b = MakeRecord("device-x", 2, 1'000, "memo", std::string("new"));
  assert(std::get<std::string>(*ConflictResolver::FoldField({b, a}, "memo")) == "new");
}

void TestConcurrentTombstoneWithLaterHintDeletesEntity() {
  // Y edits at clock 4 without having seen X's delete at clock 5.
  auto edit = MakeRecord("device-y", 4, 1'000, "balance", Balance(70));
  auto del  = MakeRecord("device-x", 5, 2'000, kLifecycleField, Tombstone{});

  assert(!ConflictResolver::HappensBefore(edit, del));
  assert(!ConflictResolver::HappensBefore(del, edit));

  auto snapshot = ConflictResolver::FoldEntity("account-1", {edit, del});
  assert(snapshot.deleted);
  assert(snapshot.fields.empty());
}

void TestConcurrentEditWithLaterHintKeepsEntity() {
  auto edit = MakeRecord("device-y", 4, 3'000, "balance", Balance(70));
  auto del  = MakeRecord("device-x", 5, 2'000, kLifecycleField, Tombstone{});

  auto snapshot = ConflictResolver::FoldEntity("account-1", {edit, del});
  assert(!snapshot.deleted);
  assert(std::get<Money>(snapshot.fields.at("balance")) == Balance(70));
}

void TestDeleteAfterEditAlwaysWins() {
  auto edit = MakeRecord("device-y", 4, 9'000, "balance", Balance(70));
  auto del  = MakeRecord("device-x", 5, 1'000, kLifecycleField, Tombstone{}, VectorClock({{"device-y", 4}}));

  assert(ConflictResolver::FoldEntity("account-1", {edit, del}).deleted);
}

void TestFieldsWrittenBeforeDeleteStayGone() {
  auto memo     = MakeRecord("device-x", 1, 1'000, "memo", std::string("old"));
  auto del      = MakeRecord("device-x", 2, 2'000, kLifecycleField, Tombstone{});
  auto category = MakeRecord("device-x", 3, 3'000, "category", std::string("new"));

  // The later write brings the entity back, not the memo the delete removed.
  auto snapshot = ConflictResolver::FoldEntity("account-1", {memo, del, category});
  assert(!snapshot.deleted);
  assert(!snapshot.fields.contains("memo"));
  assert(std::get<std::string>(snapshot.fields.at("category")) == "new");

  // A write on another device that never saw the delete survives it.
  auto concurrent = MakeRecord("device-y", 1, 1'500, "memo", std::string("concurrent"));
  snapshot        = ConflictResolver::FoldEntity("account-1", {memo, del, category, concurrent});
  assert(std::get<std::string>(snapshot.fields.at("memo")) == "concurrent");

  // Seen by the delete on another device: erased as well.
  auto seen = MakeRecord("device-y", 1, 1'500, "memo", std::string("seen"));
  auto del2 = MakeRecord("device-x", 2, 2'000, kLifecycleField, Tombstone{}, VectorClock({{"device-y", 1}}));
  snapshot  = ConflictResolver::FoldEntity("account-1", {seen, del2, category});
  assert(!snapshot.fields.contains("memo"));
}

void TestFieldsResolveIndependently() {
  auto x_balance = MakeRecord("device-x", 1, 2'000, "balance", Balance(100));
  auto x_memo    = MakeRecord("device-x", 2, 2'000, "memo", std::string("x memo"), VectorClock({{"device-x", 1}}));
  auto y_memo    = MakeRecord("device-y", 1, 3'000, "memo", std::string("y memo"));
  auto y_balance = MakeRecord("device-y", 2, 1'000, "balance", Balance(50), VectorClock({{"device-y", 1}}));

  auto snapshot = ConflictResolver::FoldEntity("account-1", {x_balance, x_memo, y_memo, y_balance});
  assert(std::get<Money>(snapshot.fields.at("balance")) == Balance(100));
  assert(std::get<std::string>(snapshot.fields.at("memo")) == "y memo");
}

void TestTombstonedFieldIsOmitted() {
  auto set   = MakeRecord("device-x", 1, 1'000, "category", std::string("rent"));
  auto clear = MakeRecord("device-x", 2, 2'000, "category", Tombstone{});
  auto snap  = ConflictResolver::FoldEntity("account-1", {set, clear});
  assert(!snap.deleted);
  assert(!snap.fields.contains("category"));
}

void TestCompactedRecordsAreIgnored() {
  auto a     = MakeRecord("device-x", 1, 1'000, "memo", std::string("a"));
  auto b     = MakeRecord("device-x", 2, 2'000, "memo", std::string("b"));
  b.compacted = true;
  assert(std::get<std::string>(*ConflictResolver::FoldField({a, b}, "memo")) == "a");
  assert(!ConflictResolver::Winner({b}).has_value());
}

void TestFoldIgnoresOrderAndDuplicates() {
  std::vector<ChangeRecord> records = {
      MakeRecord("device-x", 1, 1'000, "balance", Balance(10)),
      MakeRecord("device-y", 1, 1'500, "balance", Balance(20)),
      MakeRecord("device-x", 2, 1'200, "balance", Balance(30), VectorClock({{"device-y", 1}})),
      MakeRecord("device-z", 1, 1'200, "memo", std::string("z")),
      MakeRecord("device-y", 2, 900, "memo", std::string("y"), VectorClock({{"device-y", 1}})),
      MakeRecord("device-z", 2, 5'000, kLifecycleField, std::string("live"), VectorClock({{"device-z", 1}})),
  };
  const auto expected = ConflictResolver::FoldEntity("account-1", records);
  assert(std::get<Money>(expected.fields.at("balance")) == Balance(30));

  std::mt19937 rng(42);
  for (int round = 0; round < 50; ++round) {
    auto shuffled = records;
    const auto extra = static_cast<std::size_t>(rng() % records.size());
    shuffled.push_back(records[extra]);
    shuffled.push_back(records[(extra + 2) % records.size()]);
    std::shuffle(shuffled.begin(), shuffled.end(), rng);
    assert(ConflictResolver::FoldEntity("account-1", shuffled) == expected);
  }
}

} // namespace

int main() {
  TestConcurrentWritesPickLaterWallClock();
  TestExactTimestampTieBreaksOnDeviceId();
  TestCausalDescendantBeatsLaterTimestamp();
  TestSameDeviceOrderedByClock();
  TestConcurrentTombstoneWithLaterHintDeletesEntity();
  TestConcurrentEditWithLaterHintKeepsEntity();
  TestDeleteAfterEditAlwaysWins();
  TestFieldsWrittenBeforeDeleteStayGone();
  TestFieldsResolveIndependently();
  TestTombstonedFieldIsOmitted();
  TestCompactedRecordsAreIgnored();
  TestFoldIgnoresOrderAndDuplicates();

  std::cout << "vaultsync_unit_conflict_resolver: pass\n";
  return 0;
}
