#include "internal/observability/otlp.hpp"

#ifdef ENABLE_OTEL

#include <unistd.h>

#include <cstdlib>

namespace recsync::observability {

OtlpTarget ResolveOtlpTarget(const recsync::runtime::config::ObservabilityConfig& config, const char* signal_env, const char* http_path) {
  OtlpTarget target;
  target.http = config.transport() == recsync::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!config.otlp_endpoint().empty()) {
    target.endpoint = config.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(signal_env)) {
    target.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    target.endpoint = endpoint;
  } else {
    target.endpoint = target.http ? std::string("http://localhost:4318") + http_path : "localhost:4317";
  }
  return target;
}

opentelemetry::sdk::resource::Resource ServiceResource() {
  char host[256] = {};
  if (::gethostname(host, sizeof(host) - 1) != 0) {
    host[0] = '\0';
  }
  return opentelemetry::sdk::resource::Resource::Create({
      {"service.name", kInstrumentationName},
      {"service.version", kInstrumentationVersion},
      {"host.name", std::string(host)},
  });
}

} // namespace recsync::observability

#endif
