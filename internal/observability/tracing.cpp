#include "internal/observability/spans.hpp"

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

#include <mutex>
#include <utility>

namespace resolver::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

constexpr const char* kInstrumentationName    = "entity-resolver";
constexpr const char* kInstrumentationVersion = "0.1.0";

struct TracerState {
  std::mutex                                          mutex;
  std::shared_ptr<sdktrace::TracerProvider>           provider;
  opentelemetry::nostd::shared_ptr<trace_api::Tracer> tracer;
};

TracerState& State() {
  static TracerState state;
  return state;
}

std::unique_ptr<sdktrace::SpanExporter> MakeSpanExporter(const ExportSettings& settings) {
  const auto endpoint = ResolveEndpoint(settings, Signal::kTraces);
  if (settings.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

// Spans opened before InitializeTracing fall back to the global (noop) provider.
opentelemetry::nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  auto&                       state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  if (!state.tracer) {
    auto provider = trace_api::Provider::GetTracerProvider();
    if (provider) state.tracer = provider->GetTracer(kInstrumentationName, kInstrumentationVersion);
  }
  return state.tracer;
}

} // namespace

bool InitializeTracing(const ExportSettings& settings) {
  resource::ResourceAttributes attrs = {
      {"service.name", settings.service_name},
      {"service.version", settings.service_version},
  };
  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeSpanExporter(settings), sdktrace::BatchSpanProcessorOptions{});
  std::shared_ptr<sdktrace::TracerProvider> provider =
      sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attrs));

  auto&                       state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  state.provider = provider;
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(provider));
  state.tracer = provider->GetTracer(kInstrumentationName, kInstrumentationVersion);
  return static_cast<bool>(state.tracer);
}

void ShutdownTracing() {
  auto&                       state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  if (state.provider) {
    state.provider->ForceFlush();
    state.provider->Shutdown();
  }
  state.provider.reset();
  state.tracer = nullptr;
}

// ---------------------------------------------------------------------------

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;

  bool Live() const {
    return static_cast<bool>(span);
  }
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = CurrentTracer();
  if (!tracer) return;

  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->Live()) {
    impl_->scope.reset();
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->Live()) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->Live()) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_ && impl_->Live()) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->Live()) impl_->span->AddEvent(std::string(name));
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_ || !impl_->Live()) return;
  const std::string message(description);
  impl_->span->AddEvent("exception", {{"exception.message", message}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, message);
}

} // namespace resolver::observability

#endif
