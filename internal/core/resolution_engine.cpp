#include "resolution_engine.hpp"

#include <algorithm>
#include <future>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/worker_pool.hpp"
#include "internal/resolution/master_entity_builder.hpp"
#include "internal/util/errors.hpp"

namespace resolver::core {

namespace {

constexpr std::size_t kNormalizeBatchSize = 256;

struct ScoredBlock {
  std::vector<model::SimilarityEdge> edges;
  std::size_t                        comparisons = 0;
};

void CheckRecord(const model::Record& record, std::size_t position, const std::unordered_set<std::string>& seen) {
  if (record.id.empty()) {
    throw util::MalformedRecordError(position, "record at position " + std::to_string(position) + " has no id");
  }
  if (seen.contains(record.id)) {
    throw util::MalformedRecordError(position, "duplicate record id '" + record.id + "' at position " + std::to_string(position));
  }
}

config::ResolutionConfig Validated(config::ResolutionConfig config) {
  config::Validate(config);
  return config;
}

} // namespace

ResolutionEngine::ResolutionEngine(config::ResolutionConfig config)
    : config_(Validated(std::move(config))),
      normalizer_(config_.normalization),
      blocker_(config_.blocking),
      scorer_(config_.scoring) {
}

std::vector<model::Record> ResolutionEngine::Accept(const std::vector<model::Record>& input, std::vector<RecordRejection>& rejections) const {
  std::vector<model::Record>      accepted;
  std::unordered_set<std::string> seen;
  accepted.reserve(input.size());

  for (std::size_t i = 0; i < input.size(); ++i) {
    const auto& record = input[i];
    try {
      CheckRecord(record, i, seen);
    } catch (const util::MalformedRecordError& e) {
      RESOLVER_LOG_WARN("record rejected", {observability::IntField("position", static_cast<std::int64_t>(e.Position())),
                                            observability::StringField("record_id", record.id), observability::StringField("reason", e.what())});
      rejections.push_back({e.Position(), record.id, e.what()});
      continue;
    }
    seen.insert(record.id);
    accepted.push_back(record);
  }

  std::sort(accepted.begin(), accepted.end(), [](const auto& a, const auto& b) { return model::CompareRecordIds(a.id, b.id) < 0; });
  return accepted;
}

RunResult ResolutionEngine::Run(const std::vector<model::Record>& input) const {
  observability::SpanScope run_span("resolver.run");
  run_span.SetAttribute("mode", config::ToString(config_.mode));
  run_span.SetAttribute("input_records", static_cast<std::int64_t>(input.size()));

  try {
    auto result = Execute(input);
    observability::Metrics::Instance().RecordRun(config::ToString(config_.mode), true);
    return result;
  } catch (const std::exception& e) {
    run_span.RecordException(e.what());
    observability::Metrics::Instance().RecordRun(config::ToString(config_.mode), false);
    throw;
  }
}

RunResult ResolutionEngine::Execute(const std::vector<model::Record>& input) const {
  RunResult result;
  result.mode                = config_.mode;
  result.stats.input_records = input.size();

  // ------------------------------------------------------------------
  // Ingest checks
  // ------------------------------------------------------------------
  result.records                = Accept(input, result.rejections);
  result.stats.accepted_records = result.records.size();
  observability::Metrics::Instance().AddRecords("accepted", result.records.size());
  observability::Metrics::Instance().AddRecords("rejected", result.rejections.size());

  // task inputs outlive the pool so queued work never sees freed state
  std::vector<model::NormalizedRecord> normalized;
  blocking::BlockingResult             blocking;

  pipeline::WorkerPool pool(config_.worker_threads);
  pool.Start();

  // ------------------------------------------------------------------
  // Normalize
  // ------------------------------------------------------------------
  {
    observability::StageScope stage("normalize");
    auto&                     span = stage.Span();

    std::vector<std::future<std::vector<model::NormalizedRecord>>> batches;
    for (std::size_t begin = 0; begin < result.records.size(); begin += kNormalizeBatchSize) {
      const std::size_t end = std::min(begin + kNormalizeBatchSize, result.records.size());
      batches.push_back(pool.Submit([this, &result, begin, end] {
        std::vector<model::NormalizedRecord> out;
        out.reserve(end - begin);
        for (std::size_t i = begin; i < end; ++i) out.push_back(normalizer_.NormalizeRecord(result.records[i]));
        return out;
      }));
    }

    normalized.reserve(result.records.size());
    for (auto& batch : batches) {
      for (auto& record : batch.get()) normalized.push_back(std::move(record));
    }
    for (const auto& record : normalized) result.graph.AddNode(record);

    span.SetAttribute("records", static_cast<std::int64_t>(normalized.size()));
  }

  // ------------------------------------------------------------------
  // Block + score
  // ------------------------------------------------------------------
  {
    observability::StageScope stage("score");
    auto&                     span = stage.Span();

    blocking = blocker_.Block(normalized, config_.clustering.seed);
    if (blocking.warning) result.warnings.push_back(*blocking.warning);
    result.stats.blocks = blocking.blocks.size();

    std::vector<std::future<ScoredBlock>> scored;
    scored.reserve(blocking.blocks.size());
    for (const auto& block : blocking.blocks) {
      if (block.members.size() < 2) continue;
      scored.push_back(pool.Submit([this, &block, &blocking, &normalized] {
        ScoredBlock out;
        for (std::size_t i = 0; i < block.members.size(); ++i) {
          for (std::size_t j = i + 1; j < block.members.size(); ++j) {
            const auto a = block.members[i];
            const auto b = block.members[j];
            if (!blocking::IsFirstSharedKey(blocking.keys_of[a], blocking.keys_of[b], block.key)) continue;

            ++out.comparisons;
            if (auto edge = scorer_.ScoreCandidate(normalized[a], normalized[b])) out.edges.push_back(std::move(*edge));
          }
        }
        return out;
      }));
    }

    // single writer, block-key order
    for (auto& future : scored) {
      auto block = future.get();
      result.stats.comparisons += block.comparisons;
      for (auto& edge : block.edges) result.graph.AddEdge(std::move(edge));
    }
    result.stats.edges = result.graph.EdgeCount();

    observability::Metrics::Instance().AddComparisons("edge", result.stats.edges);
    observability::Metrics::Instance().AddComparisons("below_threshold", result.stats.comparisons - result.stats.edges);
    span.SetAttribute("comparisons", static_cast<std::int64_t>(result.stats.comparisons));
    span.SetAttribute("edges", static_cast<std::int64_t>(result.stats.edges));
  }

  pool.Stop();

  // ------------------------------------------------------------------
  // Cluster
  // ------------------------------------------------------------------
  {
    observability::StageScope stage("cluster");
    auto&                     span = stage.Span();

    cluster::ClusterExtractor extractor(config_.clustering);
    span.SetAttribute("algorithm", extractor.ActivePartitioner().Name());
    result.clusters         = extractor.Extract(result.graph);
    result.stats.clusters   = result.clusters.clusters.size();
    result.stats.singletons = result.clusters.singletons.size();

    observability::Metrics::Instance().SetClusterCount("cluster", result.stats.clusters);
    observability::Metrics::Instance().SetClusterCount("singleton", result.stats.singletons);
  }

  // ------------------------------------------------------------------
  // Resolve
  // ------------------------------------------------------------------
  {
    observability::StageScope stage("resolve");
    auto&                     span = stage.Span();

    resolution::MasterEntityBuilder builder(config_.clustering.seed);
    auto                            masters  = builder.Build(result.clusters.clusters, result.graph);
    auto                            strategy = resolution::MakeResolutionStrategy(config_.mode);
    result.resolution                        = strategy->Resolve(result.records, result.clusters, std::move(masters));
    span.SetAttribute("masters", static_cast<std::int64_t>(result.resolution.masters.size()));

  }

  RESOLVER_LOG_INFO("resolution run complete",
                    {observability::StringField("mode", config::ToString(config_.mode)),
                     observability::IntField("records", static_cast<std::int64_t>(result.stats.accepted_records)),
                     observability::IntField("rejected", static_cast<std::int64_t>(result.rejections.size())),
                     observability::IntField("comparisons", static_cast<std::int64_t>(result.stats.comparisons)),
                     observability::IntField("edges", static_cast<std::int64_t>(result.stats.edges)),
                     observability::IntField("clusters", static_cast<std::int64_t>(result.stats.clusters)),
                     observability::IntField("singletons", static_cast<std::int64_t>(result.stats.singletons))});
  return result;
}

} // namespace resolver::core
