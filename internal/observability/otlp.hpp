#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <string>

#include "config/config.pb.h"

namespace recsync::observability {

struct OtlpTarget {
  std::string endpoint;
  bool        http = false;
};

// Endpoint precedence: config, OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
// OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
OtlpTarget ResolveOtlpTarget(const recsync::runtime::config::ObservabilityConfig& config, const char* signal_env, const char* http_path);

opentelemetry::sdk::resource::Resource ServiceResource();

inline constexpr const char* kInstrumentationName    = "record-sync";
inline constexpr const char* kInstrumentationVersion = "0.1.0";

} // namespace recsync::observability

#endif
