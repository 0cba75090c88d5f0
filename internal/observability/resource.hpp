#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include "internal/observability/spans.hpp"

namespace vaultsync::observability {

inline opentelemetry::sdk::resource::Resource MakeResource(const ServiceInfo& service) {
  opentelemetry::sdk::resource::ResourceAttributes attrs = {
      {"service.name", service.name},
      {"service.version", service.version},
  };
  if (!service.vault_id.empty()) {
    attrs.SetAttribute("vaultsync.vault_id", service.vault_id);
  }
  return opentelemetry::sdk::resource::Resource::Create(attrs);
}

} // namespace vaultsync::observability

#endif
