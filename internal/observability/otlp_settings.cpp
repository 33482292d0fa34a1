#include "internal/observability/otlp_settings.hpp"

#include <cstdlib>

#include "config/config.pb.h"
#include "internal/observability/spans.hpp"

namespace resolver::observability {

namespace pb = resolver::runtime::config;

namespace {

const char* EnvOrNull(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr && *value != '\0' ? value : nullptr;
}

} // namespace

ExportSettings SettingsFor(const pb::RuntimeConfig& config, Signal signal) {
  const auto& observability = config.observability();

  ExportSettings settings;
  settings.enabled = signal == Signal::kTraces ? observability.tracing_enabled() : observability.metrics_enabled();
  if (!observability.service_name().empty()) settings.service_name = observability.service_name();
  settings.endpoint  = observability.otlp_endpoint();
  settings.transport = observability.transport() == pb::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (observability.metrics_export_interval_ms() > 0) {
    settings.export_interval = std::chrono::milliseconds(observability.metrics_export_interval_ms());
  }
  return settings;
}

std::string ResolveEndpoint(const ExportSettings& settings, Signal signal) {
  if (!settings.endpoint.empty()) return settings.endpoint;

  const bool traces = signal == Signal::kTraces;
  if (const char* endpoint = EnvOrNull(traces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) return endpoint;
  if (const char* endpoint = EnvOrNull("OTEL_EXPORTER_OTLP_ENDPOINT")) return endpoint;

  if (settings.transport == OtlpTransport::kGrpc) return "localhost:4317";
  return traces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

// Disabled signals shut down any provider left from an earlier call.
bool InitializeTracing(const pb::RuntimeConfig& config) {
  const auto settings = SettingsFor(config, Signal::kTraces);
  if (!settings.enabled) {
    ShutdownTracing();
    return false;
  }
  return InitializeTracing(settings);
}

bool InitializeMetrics(const pb::RuntimeConfig& config) {
  const auto settings = SettingsFor(config, Signal::kMetrics);
  if (!settings.enabled) {
    ShutdownMetrics();
    return false;
  }
  return InitializeMetrics(settings);
}

} // namespace resolver::observability
