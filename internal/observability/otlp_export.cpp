#include "internal/observability/otlp_export.hpp"

#ifdef ENABLE_OTEL

#include <cstdlib>

#include "config/config.pb.h"

namespace recall::observability {

namespace {

const char* SignalEnvVar(Signal signal) {
  return signal == Signal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
}

std::string DefaultEndpoint(bool http, Signal signal) {
  if (!http) return "localhost:4317";
  return signal == Signal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

} // namespace

ExportTarget ResolveExportTarget(const recall::runtime::config::ObservabilityConfig& config, Signal signal) {
  ExportTarget target;
  target.http = config.transport() == recall::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!config.otlp_endpoint().empty()) {
    target.endpoint = config.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(SignalEnvVar(signal))) {
    target.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    target.endpoint = endpoint;
  } else {
    target.endpoint = DefaultEndpoint(target.http, signal);
  }
  return target;
}

opentelemetry::sdk::resource::Resource ServiceResource() {
  return opentelemetry::sdk::resource::Resource::Create({
      {"service.name", std::string(kInstrumentationName)},
      {"service.version", std::string(kInstrumentationVersion)},
  });
}

} // namespace recall::observability

#endif
