#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <utility>

#include "config/config.pb.h"

namespace dashstream::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;
namespace cfg         = dashstream::runtime::config;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Counter       = opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>;
using Histogram     = opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>;

constexpr std::uint32_t kDefaultExportIntervalMs = 1000;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// Instrument families can be muted independently of the exporter.
std::atomic<bool> g_readiness_enabled{true};
std::atomic<bool> g_repair_enabled{true};

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

sdkmetrics::PeriodicExportingMetricReaderOptions MakeReaderOptions(const cfg::ObservabilityConfig::MetricsConfig& metrics) {
  sdkmetrics::PeriodicExportingMetricReaderOptions options;
  const auto interval_ms         = metrics.collection_interval_ms() > 0 ? metrics.collection_interval_ms() : kDefaultExportIntervalMs;
  options.export_interval_millis = std::chrono::milliseconds(std::max(metrics.min_collection_interval_ms(), interval_ms));
  if (metrics.export_timeout_ms() > 0) {
    options.export_timeout_millis = std::chrono::milliseconds(metrics.export_timeout_ms());
  }
  return options;
}

template <typename Provider>
void AttachReader(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

void Add(const Counter& counter, std::initializer_list<AttributePair> attributes) {
  if constexpr (requires { counter->Add(std::uint64_t{1}, attributes, opentelemetry::context::Context{}); }) {
    counter->Add(std::uint64_t{1}, attributes, opentelemetry::context::Context{});
  } else {
    counter->Add(std::uint64_t{1}, attributes);
  }
}

void Record(const Histogram& histogram, double value, std::initializer_list<AttributePair> attributes) {
  if constexpr (requires { histogram->Record(value, attributes, opentelemetry::context::Context{}); }) {
    histogram->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    histogram->Record(value, attributes);
  }
}

} // namespace

struct Metrics::Impl {
  Counter   readiness_waits;
  Histogram readiness_wait_ms;
  Counter   self_heals;
  Counter   repairs;
};

bool InitializeMetrics(const cfg::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = OtlpConfigFrom(config);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(otlp_config), MakeReaderOptions(observability.metrics()));

  auto res   = resource::Resource::Create({{"service.name", otlp_config.service_name}});
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  AttachReader(g_provider, std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_readiness_enabled = observability.metrics().readiness_metrics_enabled();
  g_repair_enabled    = observability.metrics().repair_metrics_enabled();
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
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter("dashstream", "0.1.0");

  impl_->readiness_waits   = meter->CreateUInt64Counter("dashstream.readiness.wait.count", "Completed readiness waits", "1");
  impl_->readiness_wait_ms = meter->CreateDoubleHistogram("dashstream.readiness.wait.duration_ms", "Readiness wait duration", "ms");
  impl_->self_heals        = meter->CreateUInt64Counter("dashstream.readiness.self_heal.count", "Self-heal rebuild attempts", "1");
  impl_->repairs           = meter->CreateUInt64Counter("dashstream.repair.count", "Playback error repair outcomes", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordReadinessWait(std::string_view kind, std::string_view outcome) {
  if (g_readiness_enabled && impl_->readiness_waits) {
    Add(impl_->readiness_waits, {{"kind", std::string(kind)}, {"outcome", std::string(outcome)}});
  }
}

void Metrics::ObserveReadinessWaitMs(std::string_view kind, double latency_ms) {
  if (g_readiness_enabled && impl_->readiness_wait_ms) {
    Record(impl_->readiness_wait_ms, latency_ms, {{"kind", std::string(kind)}});
  }
}

void Metrics::RecordSelfHeal(std::string_view reason, bool triggered) {
  if (g_readiness_enabled && impl_->self_heals) {
    Add(impl_->self_heals, {{"reason", std::string(reason)}, {"triggered", triggered}});
  }
}

void Metrics::RecordRepair(std::string_view outcome) {
  if (g_repair_enabled && impl_->repairs) {
    Add(impl_->repairs, {{"outcome", std::string(outcome)}});
  }
}

} // namespace dashstream::observability

#endif
