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

#include <map>
#include <memory>
#include <mutex>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define RESOLVER_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define RESOLVER_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

namespace resolver::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Attributes    = std::initializer_list<AttributePair>;

std::mutex                                 g_provider_mutex;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const ExportSettings& settings) {
  const auto endpoint = ResolveEndpoint(settings, Signal::kMetrics);
  if (settings.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

std::unique_ptr<sdkmetrics::MetricReader> MakeReader(const ExportSettings& settings) {
  sdkmetrics::PeriodicExportingMetricReaderOptions options;
  options.export_interval_millis = settings.export_interval;
#ifdef RESOLVER_OTEL_METRIC_READER_FACTORY
  return sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(settings), options);
#else
  return std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(MakeMetricExporter(settings), options);
#endif
}

// SDK releases differ in reader ownership and in the context argument.
template <typename Provider>
void AttachReader(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value>
void Add(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, const Attributes& attributes) {
  if constexpr (requires { instrument->Add(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Add(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Add(value, attributes);
  }
}

template <typename Instrument, typename Value>
void Record(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, const Attributes& attributes) {
  if constexpr (requires { instrument->Record(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Record(value, attributes);
  }
}

} // namespace

bool InitializeMetrics(const ExportSettings& settings) {
  resource::ResourceAttributes attrs = {
      {"service.name", settings.service_name},
      {"service.version", settings.service_version},
  };
  auto provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                              resource::Resource::Create(attrs));
  AttachReader(provider, MakeReader(settings));

  std::lock_guard<std::mutex> lock(g_provider_mutex);
  g_provider = provider;
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(provider));
  return true;
}

void ShutdownMetrics() {
  std::lock_guard<std::mutex> lock(g_provider_mutex);
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

// ---------------------------------------------------------------------------

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> runs;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> records;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> comparisons;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      stage_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   clusters;

  // Last reported value per kind, read by the gauge callback.
  std::mutex                          cluster_mutex;
  std::map<std::string, std::int64_t> cluster_counts;

  static void ObserveClusters(metrics_api::ObserverResult result, void* state) {
    auto*                       impl = static_cast<Impl*>(state);
    std::lock_guard<std::mutex> lock(impl->cluster_mutex);
    auto observer = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
    for (const auto& [kind, count] : impl->cluster_counts) {
      observer->Observe(count, Attributes{{"kind", kind}});
    }
  }
};

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("entity-resolver", "0.1.0");

  impl_->runs              = impl_->meter->CreateUInt64Counter("resolver.run.count", "Resolution runs by mode and outcome", "1");
  impl_->records           = impl_->meter->CreateUInt64Counter("resolver.record.count", "Input records accepted or rejected", "1");
  impl_->comparisons       = impl_->meter->CreateUInt64Counter("resolver.comparison.count", "Candidate pair comparisons by outcome", "1");
  impl_->stage_duration_ms = impl_->meter->CreateDoubleHistogram("resolver.stage.duration_ms", "Pipeline stage latency", "ms");
  impl_->clusters          = impl_->meter->CreateInt64ObservableGauge("resolver.cluster.count", "Clusters and singletons in the last run", "1");
  impl_->clusters->AddCallback(&Impl::ObserveClusters, impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRun(std::string_view mode, bool success) {
  if (!impl_->runs) return;
  const std::string mode_value(mode);
  Add(impl_->runs, std::uint64_t{1}, Attributes{{"mode", mode_value}, {"success", success}});
}

void Metrics::AddRecords(std::string_view outcome, std::uint64_t count) {
  if (!impl_->records || count == 0) return;
  const std::string outcome_value(outcome);
  Add(impl_->records, count, Attributes{{"outcome", outcome_value}});
}

void Metrics::ObserveStageDurationMs(std::string_view stage, double duration_ms) {
  if (!impl_->stage_duration_ms) return;
  const std::string stage_value(stage);
  Record(impl_->stage_duration_ms, duration_ms, Attributes{{"stage", stage_value}});
}

void Metrics::AddComparisons(std::string_view outcome, std::uint64_t count) {
  if (!impl_->comparisons || count == 0) return;
  const std::string outcome_value(outcome);
  Add(impl_->comparisons, count, Attributes{{"outcome", outcome_value}});
}

void Metrics::SetClusterCount(std::string_view kind, std::uint64_t count) {
  std::lock_guard<std::mutex> lock(impl_->cluster_mutex);
  impl_->cluster_counts[std::string(kind)] = static_cast<std::int64_t>(count);
}

} // namespace resolver::observability

#endif
