#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace dashstream::runtime::config {
class RuntimeConfig;
}

namespace dashstream::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"dashstream"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

OtlpConfig OtlpConfigFrom(const dashstream::runtime::config::RuntimeConfig& config);

/*
  Explicit endpoint, then OTEL_EXPORTER_OTLP_{TRACES|METRICS}_ENDPOINT, then
  OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
  signal: "traces" | "metrics"
*/
std::string ResolveOtlpEndpoint(const OtlpConfig& config, std::string_view signal);

bool InitializeTracing(const dashstream::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const dashstream::runtime::config::RuntimeConfig& config);
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
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide instruments.

  kind:    "manifest" | "segment"
  outcome: "ready" | "not_ready" | "build_failed" | "error"
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordReadinessWait(std::string_view kind, std::string_view outcome);
  void ObserveReadinessWaitMs(std::string_view kind, double latency_ms);
  void RecordSelfHeal(std::string_view reason, bool triggered);
  void RecordRepair(std::string_view outcome);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const dashstream::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const dashstream::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordReadinessWait(std::string_view, std::string_view) {
}

inline void Metrics::ObserveReadinessWaitMs(std::string_view, double) {
}

inline void Metrics::RecordSelfHeal(std::string_view, bool) {
}

inline void Metrics::RecordRepair(std::string_view) {
}
#endif

} // namespace dashstream::observability
