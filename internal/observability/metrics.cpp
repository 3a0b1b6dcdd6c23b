#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/common/key_value_iterable_view.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "config/config.pb.h"
#include "internal/observability/otlp_export.hpp"

namespace recall::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {
using Attribute  = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Attributes = std::vector<Attribute>;

constexpr uint32_t kDefaultCollectionIntervalMs = 1000;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// Snapshot of ObservabilityConfig.MetricsConfig; everything on until
// InitializeMetrics says otherwise.
struct Switches {
  bool rpc         = true;
  bool reviews     = true;
  bool latency     = true;
  bool route_label = true;
};
Switches g_switches;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const ExportTarget& target) {
  if (target.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

// AddMetricReader took a shared_ptr before opentelemetry-cpp 1.10.
template <typename Provider>
void AttachReader(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value>
void Emit(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, const Attributes& attributes) {
  const opentelemetry::common::KeyValueIterableView<Attributes> view(attributes);
  if constexpr (requires { instrument->Add(value, view, opentelemetry::context::Context{}); }) {
    instrument->Add(value, view, opentelemetry::context::Context{});
  } else if constexpr (requires { instrument->Add(value, view); }) {
    instrument->Add(value, view);
  } else if constexpr (requires { instrument->Record(value, view, opentelemetry::context::Context{}); }) {
    instrument->Record(value, view, opentelemetry::context::Context{});
  } else {
    instrument->Record(value, view);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> rpc_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      rpc_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> completions;
};

bool InitializeMetrics(const recall::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto& metric_config = observability.metrics();

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(
      metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : kDefaultCollectionIntervalMs);
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }

  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(ResolveExportTarget(observability, Signal::kMetrics)),
                                                                         reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), ServiceResource());
  AttachReader(g_provider, std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_switches.rpc         = metric_config.request_metrics_enabled();
  g_switches.reviews     = metric_config.review_metrics_enabled();
  g_switches.latency     = metric_config.request_latency_histograms_enabled();
  g_switches.route_label = metric_config.route_labels_enabled();
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

// Instruments bind to whichever provider is global at first use, so
// InitializeMetrics must run before the first RPC.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter(kInstrumentationName, kInstrumentationVersion);

  impl_->rpc_count      = impl_->meter->CreateUInt64Counter("recall.rpc.count", "Finished RPCs", "1");
  impl_->rpc_latency_ms = impl_->meter->CreateDoubleHistogram("recall.rpc.latency_ms", "RPC latency", "ms");
  impl_->completions    = impl_->meter->CreateUInt64Counter("recall.review.completions", "Complete-review calls by outcome", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRpc(std::string_view route, bool success, double latency_ms) {
  if (!g_switches.rpc) return;

  const std::string route_name(route);
  Attributes        attributes;
  if (g_switches.route_label) attributes.emplace_back("route", opentelemetry::nostd::string_view(route_name));

  if (g_switches.latency) Emit(impl_->rpc_latency_ms, latency_ms, attributes);

  attributes.emplace_back("success", success);
  Emit(impl_->rpc_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordCompletion(CompletionOutcome outcome, int quality) {
  if (!g_switches.reviews) return;

  const std::string outcome_name(CompletionOutcomeName(outcome));
  Attributes        attributes{{"outcome", opentelemetry::nostd::string_view(outcome_name)}};
  if (outcome == CompletionOutcome::kApplied && quality >= 0) {
    attributes.emplace_back("quality", static_cast<std::int64_t>(quality));
  }
  Emit(impl_->completions, static_cast<std::uint64_t>(1), attributes);
}

} // namespace recall::observability

#endif
