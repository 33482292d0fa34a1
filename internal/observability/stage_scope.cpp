#include "internal/observability/spans.hpp"

namespace resolver::observability {

StageScope::StageScope(std::string_view stage) : stage_(stage), span_("resolver." + stage_), start_(util::StartTimer()) {
}

StageScope::~StageScope() {
  const double ms = ElapsedMs();
  span_.SetAttribute("duration_ms", ms);
  Metrics::Instance().ObserveStageDurationMs(stage_, ms);
}

double StageScope::ElapsedMs() const {
  return util::ElapsedMs(start_);
}

} // namespace resolver::observability
