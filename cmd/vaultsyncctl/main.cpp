#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "internal/util/hex.hpp"
#include "vaultsync/services/v1/admin_service.grpc.pb.h"
#include "vaultsync/v1.hpp"

using namespace vaultsync::sync::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  vaultsyncctl <addr> token\n"
            << "  vaultsyncctl <addr> pair <token_hex>\n"
            << "  vaultsyncctl <addr> revoke <device_id>\n"
            << "  vaultsyncctl <addr> trigger\n"
            << "  vaultsyncctl <addr> status\n"
            << "  vaultsyncctl <addr> append <entity_id> <field_path> <kind=text|int|bool|ts|money> <value> [currency]\n"
            << "  vaultsyncctl <addr> delete <entity_id>\n"
            << "  vaultsyncctl <addr> snapshot <entity_id>\n";
}

// "12.50" -> units=1250, scale=2
static std::optional<Money> ParseMoney(const std::string& amount, const std::string& currency) {
  if (amount.empty()) return std::nullopt;

  std::string   digits;
  std::uint32_t scale    = 0;
  bool          fraction = false;
  for (std::size_t i = 0; i < amount.size(); ++i) {
    const char c = amount[i];
    if (c == '-' && i == 0) {
      digits.push_back(c);
    } else if (c == '.' && !fraction) {
      fraction = true;
    } else if (c >= '0' && c <= '9') {
      digits.push_back(c);
      if (fraction) ++scale;
    } else {
      return std::nullopt;
    }
  }
  if (digits.empty() || digits == "-") return std::nullopt;

  Money money;
  money.set_units(std::stoll(digits));
  money.set_scale(scale);
  money.set_currency(currency);
  return money;
}

static std::optional<FieldValue> ParseValue(const std::string& kind, const std::string& value, const std::string& currency) {
  FieldValue out;
  if (kind == "text") {
    out.set_text(value);
  } else if (kind == "int") {
    out.set_integer(std::stoll(value));
  } else if (kind == "bool") {
    if (value != "true" && value != "false") return std::nullopt;
    out.set_boolean(value == "true");
  } else if (kind == "ts") {
    out.set_timestamp_ms(std::stoll(value));
  } else if (kind == "money") {
    auto money = ParseMoney(value, currency);
    if (!money.has_value()) return std::nullopt;
    *out.mutable_money() = *money;
  } else {
    return std::nullopt;
  }
  return out;
}

static std::string Render(const FieldValue& value) {
  switch (value.kind_case()) {
    case FieldValue::kTombstone:
      return "<deleted>";
    case FieldValue::kText:
      return value.text();
    case FieldValue::kInteger:
      return std::to_string(value.integer());
    case FieldValue::kMoney:
      return std::to_string(value.money().units()) + "e-" + std::to_string(value.money().scale()) + " " + value.money().currency();
    case FieldValue::kBoolean:
      return value.boolean() ? "true" : "false";
    case FieldValue::kTimestampMs:
      return "ts:" + std::to_string(value.timestamp_ms());
    default:
      return "<unset>";
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = VaultAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "token") {
    DeviceTokenRequest req;
    DeviceToken        resp;

    auto status = stub->GetDeviceToken(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::string bytes;
    if (!resp.SerializeToString(&bytes)) {
      std::cerr << "failed to serialize token\n";
      return 2;
    }
    std::cout << "device_id=" << resp.device_id() << "\n";
    std::cout << "token=" << vaultsync::util::ToHex(bytes) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "pair") {
    if (argc < 4) return 1;

    PairRequest req;
    try {
      if (!req.mutable_token()->ParseFromString(vaultsync::util::FromHex(argv[3]))) {
        std::cerr << "token is not a device token\n";
        return 1;
      }
    } catch (const std::invalid_argument& e) {
      std::cerr << "invalid token: " << e.what() << "\n";
      return 1;
    }

    PairResponse resp;
    auto         status = stub->Pair(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "paired " << resp.device_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "revoke") {
    if (argc < 4) return 1;

    RevokeRequest req;
    req.set_device_id(argv[3]);
    RevokeResponse resp;

    auto status = stub->Revoke(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "revoked\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "trigger") {
    TriggerSyncRequest  req;
    TriggerSyncResponse resp;

    auto status = stub->TriggerSync(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "sessions_started=" << resp.sessions_started() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    StatusRequest  req;
    StatusResponse resp;

    auto status = stub->Status(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "device_id=" << resp.device_id() << "\n";
    std::cout << "local_clock=" << resp.local_clock() << "\n";
    std::cout << "records=" << resp.record_count() << "\n";
    for (const auto& peer : resp.peers()) {
      std::cout << "peer " << peer.device_id() << " trust=" << peer.trust_state() << " session=" << peer.session_state()
                << " last_synced_ms=" << peer.last_synced_ms() << " pending=" << peer.pending_records();
      if (peer.quarantined()) std::cout << " quarantined";
      if (!peer.last_error().empty()) std::cout << " error=\"" << peer.last_error() << "\"";
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "append") {
    if (argc < 7) return 1;

    const std::string currency = argc >= 8 ? argv[7] : "";
    std::optional<FieldValue> value;
    try {
      value = ParseValue(argv[5], argv[6], currency);
    } catch (const std::exception&) {
      value.reset();
    }
    if (!value.has_value()) {
      std::cerr << "cannot parse " << argv[6] << " as " << argv[5] << "\n";
      return 1;
    }

    AppendRequest req;
    req.set_entity_id(argv[3]);
    req.set_field_path(argv[4]);
    *req.mutable_value() = *value;
    AppendResponse resp;

    auto status = stub->Append(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "record=" << resp.record().record_id() << " clock=" << resp.record().logical_clock() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (argc < 4) return 1;

    DeleteEntityRequest req;
    req.set_entity_id(argv[3]);
    AppendResponse resp;

    auto status = stub->DeleteEntity(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted record=" << resp.record().record_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "snapshot") {
    if (argc < 4) return 1;

    SnapshotRequest req;
    req.set_entity_id(argv[3]);
    SnapshotResponse resp;

    auto status = stub->Snapshot(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "entity=" << resp.entity_id() << (resp.deleted() ? " deleted" : "") << "\n";
    for (const auto& field : resp.fields()) {
      std::cout << "  " << field.field_path() << " = " << Render(field.value()) << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
