#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/field.hpp"

namespace resolver::runtime::config {
class RuntimeConfig;
}

namespace resolver::config {

enum class Metric {
  kJaroWinkler,
  kLevenshtein,
  kExact,
  kTokenJaccard,
};

std::optional<Metric> MetricFromString(std::string_view name);
std::string_view      ToString(Metric metric);

enum class MissingFieldPolicy {
  kRenormalize,
  kZero,
};

enum class CatchAllOverflow {
  kWarn,
  kSkip,
  kSample,
};

enum class ResolutionMode {
  kMerge,
  kLink,
};

std::string_view ToString(ResolutionMode mode);

inline constexpr std::string_view kLouvain             = "louvain";
inline constexpr std::string_view kConnectedComponents = "connected_components";

struct NormalizationOptions {
  std::string   phone_country_code;
  std::uint32_t phone_national_length = 0;
};

struct BlockKeyPart {
  model::FieldType field         = model::FieldType::kName;
  std::size_t      prefix_length = 0; // 0 = full value
};

struct BlockKeyRule {
  std::string               name;
  std::vector<BlockKeyPart> parts;
};

struct BlockingOptions {
  std::vector<BlockKeyRule> rules;
  std::size_t               catch_all_max_size = 0;
  CatchAllOverflow          catch_all_overflow = CatchAllOverflow::kWarn;
};

struct FieldScoring {
  model::FieldType field  = model::FieldType::kName;
  Metric           metric = Metric::kExact;
  double           weight = 0.0;
};

struct ScoringOptions {
  std::vector<FieldScoring> fields;
  double                    low_threshold        = 0.0;
  MissingFieldPolicy        missing_field_policy = MissingFieldPolicy::kRenormalize;
};

struct ClusteringOptions {
  std::string   algorithm{kLouvain};
  double        high_threshold     = 0.0;
  std::uint64_t seed               = 0;
  bool          promote_singletons = false;

  double        louvain_resolution = 0.5;
  std::uint32_t louvain_max_passes = 32;

  bool          verify_determinism = false;
  std::uint32_t verification_runs  = 2;
};

/*
  ResolutionConfig

  Typed configuration for one run. Built once from RuntimeConfig (or by
  hand in tests) and passed by const reference to every component.
*/
struct ResolutionConfig {
  NormalizationOptions normalization;
  BlockingOptions      blocking;
  ScoringOptions       scoring;
  ClusteringOptions    clustering;
  ResolutionMode       mode = ResolutionMode::kLink;

  // 0 = hardware concurrency
  std::size_t worker_threads = 0;
};

// Throws util::ConfigurationError naming the first problem found.
void Validate(const ResolutionConfig& config);

/*
  Lowers the protobuf config into ResolutionConfig and validates it.

  Every resolution setting without a documented default must be present:
  thresholds, seed, resolution mode, missing-field policy, catch-all ceiling
  and overflow policy.
*/
ResolutionConfig BuildResolutionConfig(const resolver::runtime::config::RuntimeConfig& config);

} // namespace resolver::config
