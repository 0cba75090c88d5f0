#pragma once

#include <string>

#include "internal/model/change_record.hpp"
#include "internal/model/field_value.hpp"
#include "internal/model/vector_clock.hpp"
#include "vaultsync/core/v1/record.pb.h"

namespace vaultsync::wire {

/*
  Conversion between the engine's model types and their protobuf form.

  Decoding validates structure and throws util::InvalidState on malformed
  input; it never trusts a field it cannot represent.
*/

void               ToProto(const model::FieldValue& value, vaultsync::core::v1::FieldValue* out);
model::FieldValue  FromProto(const vaultsync::core::v1::FieldValue& value);

void               ToProto(const model::VectorClock& clock, vaultsync::core::v1::VectorClock* out);
model::VectorClock FromProto(const vaultsync::core::v1::VectorClock& clock);

void                ToProto(const model::ChangeRecord& record, vaultsync::core::v1::ChangeRecord* out);
model::ChangeRecord FromProto(const vaultsync::core::v1::ChangeRecord& record);

void                  ToProto(const model::EntitySnapshot& snapshot, vaultsync::core::v1::EntitySnapshot* out);
model::EntitySnapshot FromProto(const vaultsync::core::v1::EntitySnapshot& snapshot);

// Binary encodings used for storage columns.
std::string           EncodeRecord(const model::ChangeRecord& record);
model::ChangeRecord   DecodeRecord(const std::string& bytes);
std::string           EncodeClock(const model::VectorClock& clock);
model::VectorClock    DecodeClock(const std::string& bytes);
std::string           EncodeSnapshot(const model::EntitySnapshot& snapshot);
model::EntitySnapshot DecodeSnapshot(const std::string& bytes);

} // namespace vaultsync::wire
