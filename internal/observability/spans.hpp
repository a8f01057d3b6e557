#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace chatlog::runtime::config {
class RuntimeConfig;
}

namespace chatlog::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"chatlog"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t collection_interval_ms{1000};
  // "memory", "sqlite" or "postgres"; exported as chatlog.store.
  std::string store{};
};

OtlpConfig OtlpConfigFrom(const chatlog::runtime::config::RuntimeConfig& config);

// signal is "traces" or "metrics". Falls back to the OTEL_EXPORTER_OTLP_*
// environment and then to the collector's default port.
std::string ResolveOtlpEndpoint(const OtlpConfig& config, std::string_view signal);

std::map<std::string, std::string> OtlpResourceAttributes(const OtlpConfig& config);

bool InitializeTracing(const chatlog::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const chatlog::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide instruments.

    chatlog.command.count        commands by name and outcome
    chatlog.command.latency_ms   end-to-end command latency
    chatlog.append.conflicts     optimistic concurrency losses
    chatlog.projector.events     events applied to read tables
    chatlog.projector.failures   projection batches rolled back
    chatlog.recovery.streams     streams closed by the recovery sweep
*/
class Metrics {
 public:
  static Metrics& Instance();

  // outcome: "ok", "noop", "rejected", "conflict", "error"
  void RecordCommand(std::string_view command, std::string_view outcome);
  void ObserveCommandLatencyMs(std::string_view command, double latency_ms);
  void RecordVersionConflict(std::string_view stream_kind);
  void RecordProjectedEvents(std::string_view projector, std::uint64_t count);
  void RecordProjectionFailure(std::string_view projector);
  void RecordRecoveredStream(std::string_view reason);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const chatlog::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const chatlog::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordCommand(std::string_view, std::string_view) {
}

inline void Metrics::ObserveCommandLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordVersionConflict(std::string_view) {
}

inline void Metrics::RecordProjectedEvents(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordProjectionFailure(std::string_view) {
}

inline void Metrics::RecordRecoveredStream(std::string_view) {
}
#endif

} // namespace chatlog::observability
