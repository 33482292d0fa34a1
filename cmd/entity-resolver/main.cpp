#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace obs = resolver::observability;

constexpr int         kExitOk          = 0;
constexpr int         kExitUsage       = 1;
constexpr int         kExitFatal       = 2;
constexpr int         kExitConfigError = 3;
constexpr const char* kUsage           = "usage: entity-resolver <config.yaml>\n       entity-resolver --config <config.yaml>\n";

std::optional<std::string> ConfigPathFromArgs(int argc, char** argv) {
  if (argc == 2 && std::string(argv[1]) != "--config") return std::string(argv[1]);
  if (argc == 3 && std::string(argv[1]) == "--config") return std::string(argv[2]);
  return std::nullopt;
}

// Telemetry is flushed on every exit path, logging last.
struct TelemetryGuard {
  ~TelemetryGuard() {
    obs::ShutdownMetrics();
    obs::ShutdownTracing();
    obs::ShutdownLogging();
  }
};

void PrintSummary(const resolver::core::RunResult& result, std::ostream& out) {
  const auto& stats = result.stats;
  out << "mode:        " << resolver::config::ToString(result.mode) << "\n"
      << "records:     " << stats.accepted_records << " accepted / " << stats.input_records << " input\n"
      << "rejections:  " << result.rejections.size() << "\n"
      << "warnings:    " << result.warnings.size() << "\n"
      << "comparisons: " << stats.comparisons << "\n"
      << "edges:       " << stats.edges << "\n"
      << "clusters:    " << stats.clusters << " (" << stats.singletons << " singletons)\n"
      << "masters:     " << result.resolution.masters.size() << "\n"
      << "output:      " << result.resolution.resolved_records.size() << " records\n";

  for (const auto& rejection : result.rejections) {
    out << "  rejected #" << rejection.position << ": " << rejection.reason << "\n";
  }
  for (const auto& warning : result.warnings) {
    out << "  warning: " << warning.message << "\n";
  }
  out.flush();
}

int Run(const std::string& config_path) {
  const auto config = resolver::config::ConfigLoader::LoadFromYaml(config_path);
  obs::InitializeLogging(config);
  obs::InitializeTracing(config);
  obs::InitializeMetrics(config);

  // engine config is validated here, before any record is read
  auto app = resolver::factory::Build(config);

  const auto records = app.source->LoadRecords();
  const auto result  = app.engine->Run(records);
  app.writer->Write(result);
  if (app.exporter) app.exporter->WriteFile(app.export_path, result);

  PrintSummary(result, std::cout);
  return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
  const auto config_path = ConfigPathFromArgs(argc, argv);
  if (!config_path) {
    std::cerr << kUsage;
    return kExitUsage;
  }

  TelemetryGuard telemetry;
  try {
    return Run(*config_path);
  } catch (const resolver::util::ConfigurationError& e) {
    RESOLVER_LOG_ERROR("configuration rejected", {obs::StringField("config", *config_path), obs::StringField("error", e.what())});
    return kExitConfigError;
  } catch (const std::exception& e) {
    RESOLVER_LOG_ERROR("resolution run failed", {obs::StringField("config", *config_path), obs::StringField("error", e.what())});
    return kExitFatal;
  }
}
