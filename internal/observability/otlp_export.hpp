#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <string>

namespace recall::runtime::config {
class ObservabilityConfig;
}

namespace recall::observability {

inline constexpr const char* kInstrumentationName    = "recall-scheduler";
inline constexpr const char* kInstrumentationVersion = "0.1.0";

enum class Signal { kTraces, kMetrics };

struct ExportTarget {
  bool        http = false; // OTLP/HTTP protobuf instead of OTLP/gRPC
  std::string endpoint;
};

// Endpoint precedence: config, OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
// OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
ExportTarget ResolveExportTarget(const recall::runtime::config::ObservabilityConfig& config, Signal signal);

opentelemetry::sdk::resource::Resource ServiceResource();

} // namespace recall::observability

#endif
