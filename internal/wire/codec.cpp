#include "codec.hpp"

#include "internal/util/errors.hpp"

namespace vaultsync::wire {

namespace v1 = vaultsync::core::v1;

void ToProto(const model::FieldValue& value, v1::FieldValue* out) {
  out->Clear();
  std::visit(model::Overloaded{
                 [out](const model::Tombstone&) { out->mutable_tombstone(); },
                 [out](const std::string& text) { out->set_text(text); },
                 [out](std::int64_t integer) { out->set_integer(integer); },
                 [out](const model::Money& money) {
                   auto* m = out->mutable_money();
                   m->set_units(money.units);
                   m->set_scale(money.scale);
                   m->set_currency(money.currency);
                 },
                 [out](bool boolean) { out->set_boolean(boolean); },
                 [out](const model::Timestamp& ts) { out->set_timestamp_ms(ts.unix_ms); },
             },
             value);
}

model::FieldValue FromProto(const v1::FieldValue& value) {
  switch (value.kind_case()) {
    case v1::FieldValue::kTombstone:
      return model::Tombstone{};
    case v1::FieldValue::kText:
      return value.text();
    case v1::FieldValue::kInteger:
      return static_cast<std::int64_t>(value.integer());
    case v1::FieldValue::kMoney:
      return model::Money{value.money().units(), value.money().scale(), value.money().currency()};
    case v1::FieldValue::kBoolean:
      return value.boolean();
    case v1::FieldValue::kTimestampMs:
      return model::Timestamp{value.timestamp_ms()};
    case v1::FieldValue::KIND_NOT_SET:
      break;
  }
  throw util::InvalidState("field value has no kind");
}

void ToProto(const model::VectorClock& clock, v1::VectorClock* out) {
  out->Clear();
  // std::map iteration keeps entries sorted by device id.
  for (const auto& [device, counter] : clock.entries()) {
    auto* entry = out->add_entries();
    entry->set_device_id(device);
    entry->set_counter(counter);
  }
}

model::VectorClock FromProto(const v1::VectorClock& clock) {
  model::VectorClock out;
  for (const auto& entry : clock.entries()) {
    if (entry.device_id().empty()) {
      throw util::InvalidState("vector clock entry without device id");
    }
    out.Observe(entry.device_id(), entry.counter());
  }
  return out;
}

void ToProto(const model::ChangeRecord& record, v1::ChangeRecord* out) {
  out->Clear();
  out->set_record_id(record.record_id);
  out->set_entity_id(record.entity_id);
  out->set_field_path(record.field_path);
  if (!record.compacted) {
    ToProto(record.value, out->mutable_value());
  }
  out->set_device_id(record.device_id);
  out->set_logical_clock(record.logical_clock);
  out->set_wall_clock_hint_ms(record.wall_clock_hint_ms);
  ToProto(record.causal_deps, out->mutable_causal_deps());
  out->set_compacted(record.compacted);
}

model::ChangeRecord FromProto(const v1::ChangeRecord& record) {
  if (record.record_id().empty() || record.entity_id().empty() || record.field_path().empty() || record.device_id().empty()) {
    throw util::InvalidState("change record missing identity fields");
  }
  if (record.logical_clock() == 0) {
    throw util::InvalidState("change record has zero logical clock");
  }

  model::ChangeRecord out;
  out.record_id          = record.record_id();
  out.entity_id          = record.entity_id();
  out.field_path         = record.field_path();
  out.device_id          = record.device_id();
  out.logical_clock      = record.logical_clock();
  out.wall_clock_hint_ms = record.wall_clock_hint_ms();
  out.causal_deps        = FromProto(record.causal_deps());
  out.compacted          = record.compacted();
  if (!out.compacted) {
    out.value = FromProto(record.value());
  }

  if (out.causal_deps.Get(out.device_id) >= out.logical_clock) {
    throw util::InvalidState("change record depends on its own future");
  }
  return out;
}

void ToProto(const model::EntitySnapshot& snapshot, v1::EntitySnapshot* out) {
  out->Clear();
  out->set_entity_id(snapshot.entity_id);
  out->set_deleted(snapshot.deleted);
  for (const auto& [field, value] : snapshot.fields) {
    ToProto(value, &(*out->mutable_fields())[field]);
  }
}

model::EntitySnapshot FromProto(const v1::EntitySnapshot& snapshot) {
  model::EntitySnapshot out;
  out.entity_id = snapshot.entity_id();
  out.deleted   = snapshot.deleted();
  for (const auto& [field, value] : snapshot.fields()) {
    out.fields.emplace(field, FromProto(value));
  }
  return out;
}

namespace {

template <typename Message>
std::string Serialize(const Message& message, const char* what) {
  std::string bytes;
  if (!message.SerializeToString(&bytes)) {
    throw std::runtime_error(std::string("failed to serialize ") + what);
  }
  return bytes;
}

template <typename Message>
Message Parse(const std::string& bytes, const char* what) {
  Message message;
  if (!message.ParseFromString(bytes)) {
    throw util::InvalidState(std::string("failed to parse ") + what);
  }
  return message;
}

} // namespace

std::string EncodeRecord(const model::ChangeRecord& record) {
  v1::ChangeRecord proto;
  ToProto(record, &proto);
  return Serialize(proto, "change record");
}

model::ChangeRecord DecodeRecord(const std::string& bytes) {
  return FromProto(Parse<v1::ChangeRecord>(bytes, "change record"));
}

std::string EncodeClock(const model::VectorClock& clock) {
  v1::VectorClock proto;
  ToProto(clock, &proto);
  return Serialize(proto, "vector clock");
}

model::VectorClock DecodeClock(const std::string& bytes) {
  return FromProto(Parse<v1::VectorClock>(bytes, "vector clock"));
}

std::string EncodeSnapshot(const model::EntitySnapshot& snapshot) {
  v1::EntitySnapshot proto;
  ToProto(snapshot, &proto);
  return Serialize(proto, "entity snapshot");
}

model::EntitySnapshot DecodeSnapshot(const std::string& bytes) {
  return FromProto(Parse<v1::EntitySnapshot>(bytes, "entity snapshot"));
}

} // namespace vaultsync::wire
