#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define CHATLOG_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define CHATLOG_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace chatlog::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs;
  for (const auto& [key, value] : OtlpResourceAttributes(config)) attrs.SetAttribute(key, opentelemetry::nostd::string_view(value));
  return resource::Resource::Create(attrs);
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveOtlpEndpoint(config, "metrics");
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> command_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      command_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> append_conflicts;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> projected_events;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> projection_failures;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> recovered_streams;
};

bool InitializeMetrics(const chatlog::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = OtlpConfigFrom(config);
  auto       exporter    = MakeMetricExporter(otlp_config);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(otlp_config.collection_interval_ms);

#ifdef CHATLOG_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           BuildResource(otlp_config));
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("chatlog", "0.1.0");

  impl_->command_count       = impl_->meter->CreateUInt64Counter("chatlog.command.count", "Commands executed by name and outcome", "1");
  impl_->command_latency_ms  = impl_->meter->CreateDoubleHistogram("chatlog.command.latency_ms", "End-to-end command latency", "ms");
  impl_->append_conflicts    = impl_->meter->CreateUInt64Counter("chatlog.append.conflicts", "Appends rejected by the version check", "1");
  impl_->projected_events    = impl_->meter->CreateUInt64Counter("chatlog.projector.events", "Events applied to read tables", "1");
  impl_->projection_failures = impl_->meter->CreateUInt64Counter("chatlog.projector.failures", "Projection batches rolled back", "1");
  impl_->recovered_streams   = impl_->meter->CreateUInt64Counter("chatlog.recovery.streams", "Streams closed by the recovery sweep", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordCommand(std::string_view command, std::string_view outcome) {
  if (!impl_ || !impl_->command_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"command", std::string(command)}, {"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->command_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveCommandLatencyMs(std::string_view command, double latency_ms) {
  if (!impl_ || !impl_->command_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"command", std::string(command)}};
  RecordWithAttributes(impl_->command_latency_ms, latency_ms, attributes);
}

void Metrics::RecordVersionConflict(std::string_view stream_kind) {
  if (!impl_ || !impl_->append_conflicts) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"stream_kind", std::string(stream_kind)}};
  AddWithAttributes(impl_->append_conflicts, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordProjectedEvents(std::string_view projector, std::uint64_t count) {
  if (!impl_ || !impl_->projected_events || count == 0) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"projector", std::string(projector)}};
  AddWithAttributes(impl_->projected_events, count, attributes);
}

void Metrics::RecordProjectionFailure(std::string_view projector) {
  if (!impl_ || !impl_->projection_failures) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"projector", std::string(projector)}};
  AddWithAttributes(impl_->projection_failures, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordRecoveredStream(std::string_view reason) {
  if (!impl_ || !impl_->recovered_streams) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"reason", std::string(reason)}};
  AddWithAttributes(impl_->recovered_streams, static_cast<std::uint64_t>(1), attributes);
}

} // namespace chatlog::observability

#endif
