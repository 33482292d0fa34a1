#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "internal/observability/otlp_settings.hpp"
#include "internal/util/time.hpp"

namespace resolver::runtime::config {
class RuntimeConfig;
}

namespace resolver::observability {

// No-ops returning false unless built with ENABLE_OTEL.
bool InitializeTracing(const ExportSettings& settings);
bool InitializeMetrics(const ExportSettings& settings);

bool InitializeTracing(const resolver::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const resolver::runtime::config::RuntimeConfig& config);
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
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide resolution metrics:

      resolver.run.count              mode, success
      resolver.record.count           outcome (accepted|rejected)
      resolver.comparison.count       outcome (edge|below_threshold)
      resolver.stage.duration_ms      stage
      resolver.cluster.count (gauge)  kind (cluster|singleton)
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRun(std::string_view mode, bool success);
  void AddRecords(std::string_view outcome, std::uint64_t count);
  void ObserveStageDurationMs(std::string_view stage, double duration_ms);
  void AddComparisons(std::string_view outcome, std::uint64_t count);
  void SetClusterCount(std::string_view kind, std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  One pipeline stage: a "resolver.<stage>" span that also feeds the stage
  duration histogram when the scope closes.
*/
class StageScope {
 public:
  explicit StageScope(std::string_view stage);
  ~StageScope();

  StageScope(const StageScope&)            = delete;
  StageScope& operator=(const StageScope&) = delete;

  SpanScope& Span() {
    return span_;
  }

  double ElapsedMs() const;

 private:
  std::string      stage_;
  SpanScope        span_;
  util::SteadyTime start_;
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const ExportSettings&) {
  return false;
}

inline bool InitializeMetrics(const ExportSettings&) {
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

inline void SpanScope::SetAttribute(std::string_view, double) {
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

inline void Metrics::RecordRun(std::string_view, bool) {
}

inline void Metrics::AddRecords(std::string_view, std::uint64_t) {
}

inline void Metrics::ObserveStageDurationMs(std::string_view, double) {
}

inline void Metrics::AddComparisons(std::string_view, std::uint64_t) {
}

inline void Metrics::SetClusterCount(std::string_view, std::uint64_t) {
}
#endif

} // namespace resolver::observability
