#include "internal/observability/logging.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "internal/observability/spans.hpp"

namespace {

using vaultsync::observability::BoolField;
using vaultsync::observability::FormatFields;
using vaultsync::observability::IntField;
using vaultsync::observability::StringField;
using vaultsync::observability::UIntField;

void TestPlainFields() {
  assert(FormatFields({}).empty());
  assert(FormatFields({StringField("peer_id", "3f2a"), IntField("failures", -1), UIntField("sequence_no", 18446744073709551615ull),
                       BoolField("full", true)}) == "peer_id=3f2a failures=-1 sequence_no=18446744073709551615 full=true");
}

void TestValuesAreQuotedWhenNeeded() {
  assert(FormatFields({StringField("error", "sender not trusted: a1")}) == R"(error="sender not trusted: a1")");
  assert(FormatFields({StringField("memo", "say \"hi\"")}) == R"(memo="say \"hi\"")");
  assert(FormatFields({StringField("path", "a=b")}) == R"(path="a=b")");
  assert(FormatFields({StringField("reason", "")}) == R"(reason="")");
}

void TestLoggingBeforeAndAfterInitialize() {
  // Nothing configured yet: the default logger takes it.
  VAULTSYNC_LOG_INFO("before init", {StringField("device_id", "d1")});

  vaultsync::runtime::config::LoggingConfig config;
  config.set_level("warn");
  vaultsync::observability::InitializeLogging(config, "vaultsync_logging_test");
  VAULTSYNC_LOG_DEBUG("filtered out");
  VAULTSYNC_LOG_WARN("kept", {StringField("reason", "clock regression")});

  // Without an exporter spans and metrics are inert.
  vaultsync::runtime::config::ObservabilityConfig observability;
  assert(!vaultsync::observability::InitializeTracing(observability, {.name = "vaultsync_logging_test"}));
  vaultsync::observability::SpanScope span(vaultsync::observability::kSpanTriggerSync);
  span.SetAttribute(vaultsync::observability::attr::kPeerId, "d2");
  vaultsync::observability::Metrics::Instance().RecordSession("reconciled");
}

} // namespace

int main() {
  TestPlainFields();
  TestValuesAreQuotedWhenNeeded();
  TestLoggingBeforeAndAfterInitialize();

  std::cout << "vaultsync_unit_logging: pass\n";
  return 0;
}
