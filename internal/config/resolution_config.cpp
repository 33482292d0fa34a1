#include "resolution_config.hpp"

#include <cmath>
#include <set>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace resolver::config {

namespace pb = resolver::runtime::config;

namespace {

constexpr double kWeightTolerance = 1e-6;

[[noreturn]] void Fail(const std::string& message) {
  throw util::ConfigurationError(message);
}

void CheckUnitInterval(double value, const std::string& what) {
  if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
    Fail(what + " must be within [0, 1], got " + std::to_string(value));
  }
}

model::FieldType ToFieldType(pb::Field field, const std::string& context) {
  switch (field) {
    case pb::FIELD_NAME:
      return model::FieldType::kName;
    case pb::FIELD_EMAIL:
      return model::FieldType::kEmail;
    case pb::FIELD_PHONE:
      return model::FieldType::kPhone;
    case pb::FIELD_ADDRESS:
      return model::FieldType::kAddress;
    case pb::FIELD_POSTAL_CODE:
      return model::FieldType::kPostalCode;
    default:
      Fail(context + ": field is unset");
  }
}

} // namespace

std::optional<Metric> MetricFromString(std::string_view name) {
  if (name == "jaro_winkler") return Metric::kJaroWinkler;
  if (name == "levenshtein") return Metric::kLevenshtein;
  if (name == "exact") return Metric::kExact;
  if (name == "token_jaccard") return Metric::kTokenJaccard;
  return std::nullopt;
}

std::string_view ToString(Metric metric) {
  switch (metric) {
    case Metric::kJaroWinkler:
      return "jaro_winkler";
    case Metric::kLevenshtein:
      return "levenshtein";
    case Metric::kExact:
      return "exact";
    case Metric::kTokenJaccard:
      return "token_jaccard";
  }
  return "unknown";
}

std::string_view ToString(ResolutionMode mode) {
  return mode == ResolutionMode::kMerge ? "merge" : "link";
}

void Validate(const ResolutionConfig& config) {
  // blocking
  if (config.blocking.rules.empty()) {
    Fail("blocking.rules must name at least one block key rule");
  }
  std::set<std::string> rule_names;
  for (const auto& rule : config.blocking.rules) {
    if (rule.name.empty()) Fail("blocking rule without a name");
    if (rule.parts.empty()) Fail("blocking rule '" + rule.name + "' has no parts");
    if (!rule_names.insert(rule.name).second) Fail("duplicate blocking rule '" + rule.name + "'");
  }
  if (config.blocking.catch_all_max_size == 0) {
    Fail("blocking.catch_all_max_size must be positive");
  }

  // scoring
  if (config.scoring.fields.empty()) {
    Fail("scoring.fields must configure at least one field");
  }
  double                     total_weight = 0.0;
  std::set<model::FieldType> seen;
  for (const auto& field : config.scoring.fields) {
    const std::string name(model::ToString(field.field));
    if (!seen.insert(field.field).second) Fail("scoring field '" + name + "' configured twice");
    if (!std::isfinite(field.weight) || field.weight < 0.0) Fail("scoring weight for '" + name + "' must be non-negative");
    total_weight += field.weight;
  }
  if (std::fabs(total_weight - 1.0) > kWeightTolerance) {
    Fail("scoring weights must sum to 1, got " + std::to_string(total_weight));
  }
  CheckUnitInterval(config.scoring.low_threshold, "scoring.low_threshold");

  // clustering
  CheckUnitInterval(config.clustering.high_threshold, "clustering.high_threshold");
  if (config.clustering.high_threshold < config.scoring.low_threshold) {
    Fail("clustering.high_threshold must not be below scoring.low_threshold");
  }
  if (!std::isfinite(config.clustering.louvain_resolution) || config.clustering.louvain_resolution <= 0.0) {
    Fail("clustering.louvain_resolution must be positive");
  }
  if (config.clustering.louvain_max_passes == 0) {
    Fail("clustering.louvain_max_passes must be positive");
  }
  if (config.clustering.verify_determinism && config.clustering.verification_runs < 2) {
    Fail("clustering.verification_runs must be at least 2");
  }
}

ResolutionConfig BuildResolutionConfig(const pb::RuntimeConfig& proto) {
  ResolutionConfig config;

  // ------------------------------------------------------------------
  // normalization / runtime
  // ------------------------------------------------------------------
  config.normalization.phone_country_code    = proto.normalization().phone_country_code();
  config.normalization.phone_national_length = proto.normalization().phone_national_length();
  config.worker_threads                      = proto.runtime().worker_threads();

  // ------------------------------------------------------------------
  // blocking
  // ------------------------------------------------------------------
  for (const auto& rule_proto : proto.blocking().rules()) {
    BlockKeyRule rule;
    rule.name = rule_proto.name();
    for (const auto& part_proto : rule_proto.parts()) {
      BlockKeyPart part;
      part.field         = ToFieldType(part_proto.field(), "blocking rule '" + rule.name + "'");
      part.prefix_length = part_proto.prefix_length();
      rule.parts.push_back(part);
    }
    config.blocking.rules.push_back(std::move(rule));
  }
  if (!proto.blocking().has_catch_all_max_size()) {
    Fail("blocking.catch_all_max_size is required");
  }
  config.blocking.catch_all_max_size = proto.blocking().catch_all_max_size();
  switch (proto.blocking().catch_all_overflow()) {
    case pb::CATCH_ALL_OVERFLOW_WARN:
      config.blocking.catch_all_overflow = CatchAllOverflow::kWarn;
      break;
    case pb::CATCH_ALL_OVERFLOW_SKIP:
      config.blocking.catch_all_overflow = CatchAllOverflow::kSkip;
      break;
    case pb::CATCH_ALL_OVERFLOW_SAMPLE:
      config.blocking.catch_all_overflow = CatchAllOverflow::kSample;
      break;
    default:
      Fail("blocking.catch_all_overflow is required (warn|skip|sample)");
  }

  // ------------------------------------------------------------------
  // scoring
  // ------------------------------------------------------------------
  for (const auto& field_proto : proto.scoring().fields()) {
    FieldScoring field;
    field.field       = ToFieldType(field_proto.field(), "scoring field");
    const auto metric = MetricFromString(field_proto.metric());
    if (!metric) {
      Fail("unknown similarity metric '" + field_proto.metric() + "' for field '" + std::string(model::ToString(field.field)) + "'");
    }
    field.metric = *metric;
    field.weight = field_proto.weight();
    config.scoring.fields.push_back(field);
  }
  if (!proto.scoring().has_low_threshold()) {
    Fail("scoring.low_threshold is required");
  }
  config.scoring.low_threshold = proto.scoring().low_threshold();
  switch (proto.scoring().missing_field_policy()) {
    case pb::MISSING_FIELD_POLICY_RENORMALIZE:
      config.scoring.missing_field_policy = MissingFieldPolicy::kRenormalize;
      break;
    case pb::MISSING_FIELD_POLICY_ZERO:
      config.scoring.missing_field_policy = MissingFieldPolicy::kZero;
      break;
    default:
      Fail("scoring.missing_field_policy is required (renormalize|zero)");
  }

  // ------------------------------------------------------------------
  // clustering
  // ------------------------------------------------------------------
  const auto& clustering = proto.clustering();
  if (!clustering.algorithm().empty()) {
    config.clustering.algorithm = clustering.algorithm();
  }
  if (!clustering.has_high_threshold()) {
    Fail("clustering.high_threshold is required");
  }
  if (!clustering.has_seed()) {
    Fail("clustering.seed is required");
  }
  config.clustering.high_threshold     = clustering.high_threshold();
  config.clustering.seed               = clustering.seed();
  config.clustering.promote_singletons = clustering.promote_singletons();
  if (clustering.louvain_resolution() != 0.0) {
    config.clustering.louvain_resolution = clustering.louvain_resolution();
  }
  if (clustering.louvain_max_passes() != 0) {
    config.clustering.louvain_max_passes = clustering.louvain_max_passes();
  }
  config.clustering.verify_determinism = clustering.verify_determinism();
  if (clustering.verification_runs() != 0) {
    config.clustering.verification_runs = clustering.verification_runs();
  }

  // ------------------------------------------------------------------
  // resolution
  // ------------------------------------------------------------------
  switch (proto.resolution().mode()) {
    case pb::RESOLUTION_MODE_MERGE:
      config.mode = ResolutionMode::kMerge;
      break;
    case pb::RESOLUTION_MODE_LINK:
      config.mode = ResolutionMode::kLink;
      break;
    default:
      Fail("resolution.mode is required (merge|link)");
  }

  Validate(config);
  return config;
}

} // namespace resolver::config
