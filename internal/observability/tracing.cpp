#include "internal/observability/spans.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace chatlog::observability {

OtlpConfig OtlpConfigFrom(const chatlog::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp;
  otlp.endpoint  = observability.otlp_endpoint();
  otlp.transport = observability.transport() == chatlog::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (observability.collection_interval_ms() > 0) otlp.collection_interval_ms = observability.collection_interval_ms();

  if (config.database().has_postgres()) {
    otlp.store = "postgres";
  } else if (config.database().has_sqlite()) {
    otlp.store = "sqlite";
  } else {
    otlp.store = "memory";
  }
  return otlp;
}

std::string ResolveOtlpEndpoint(const OtlpConfig& config, std::string_view signal) {
  if (!config.endpoint.empty()) return config.endpoint;

  const std::string signal_env = signal == "metrics" ? "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT" : "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT";
  if (const char* endpoint = std::getenv(signal_env.c_str())) return endpoint;
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) return endpoint;

  if (config.transport == OtlpTransport::kHttpProtobuf) return "http://localhost:4318/v1/" + std::string(signal);
  return "localhost:4317";
}

std::map<std::string, std::string> OtlpResourceAttributes(const OtlpConfig& config) {
  std::map<std::string, std::string> attrs = {{"service.name", config.service_name}};
  if (!config.store.empty()) attrs.emplace("chatlog.store", config.store);
  return attrs;
}

} // namespace chatlog::observability

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <utility>

namespace chatlog::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

constexpr const char* kTracerName    = "chatlog";
constexpr const char* kTracerVersion = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeSpanExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveOtlpEndpoint(config, "traces");
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

} // namespace

bool InitializeTracing(const chatlog::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto otlp_config = OtlpConfigFrom(config);

  resource::ResourceAttributes attrs;
  for (const auto& [key, value] : OtlpResourceAttributes(otlp_config)) attrs.SetAttribute(key, opentelemetry::nostd::string_view(value));

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeSpanExporter(otlp_config), sdktrace::BatchSpanProcessorOptions{});
  auto provider  = sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attrs));

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kTracerName, kTracerVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) {
    if (auto provider = trace_api::Provider::GetTracerProvider()) g_tracer = provider->GetTracer(kTracerName, kTracerVersion);
  }
  if (!g_tracer) return;

  impl_->span  = g_tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) impl_->span->End();
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->span) impl_->span->SetAttribute(std::string(key), value);
}

// Command failures mark the span as an error; the message becomes an
// "exception" event.
void SpanScope::RecordException(std::string_view description) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

} // namespace chatlog::observability

#endif
