#pragma once

#include <chrono>
#include <string>

namespace resolver::runtime::config {
class RuntimeConfig;
}

namespace resolver::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class Signal {
  kTraces,
  kMetrics,
};

/*
  Where one telemetry signal leaves the process.

  Built from the observability section. An empty endpoint falls back to
  OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, then OTEL_EXPORTER_OTLP_ENDPOINT,
  then the collector default for the transport.
*/
struct ExportSettings {
  bool                      enabled = false;
  std::string               service_name{"entity-resolver"};
  std::string               service_version{"0.1.0"};
  std::string               endpoint;
  OtlpTransport             transport = OtlpTransport::kGrpc;
  bool                      insecure  = true;
  std::chrono::milliseconds export_interval{1000};
};

ExportSettings SettingsFor(const resolver::runtime::config::RuntimeConfig& config, Signal signal);

std::string ResolveEndpoint(const ExportSettings& settings, Signal signal);

} // namespace resolver::observability
