#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/blocking/blocker.hpp"
#include "internal/cluster/cluster_extractor.hpp"
#include "internal/config/resolution_config.hpp"
#include "internal/graph/similarity_graph.hpp"
#include "internal/model/cluster.hpp"
#include "internal/model/record.hpp"
#include "internal/normalize/normalizer.hpp"
#include "internal/resolution/resolution_strategy.hpp"
#include "internal/scoring/pair_scorer.hpp"

namespace resolver::core {

// A record refused at ingest. The run continues without it.
struct RecordRejection {
  std::size_t position = 0; // index in the input sequence
  std::string record_id;    // empty when the id itself was missing
  std::string reason;
};

struct RunStats {
  std::size_t input_records    = 0;
  std::size_t accepted_records = 0;
  std::size_t blocks           = 0;
  std::size_t comparisons      = 0;
  std::size_t edges            = 0;
  std::size_t clusters         = 0;
  std::size_t singletons       = 0;
};

/*
  Everything one run produced. The engine never writes it anywhere; the
  result writer and graph exporter consume it.
*/
struct RunResult {
  config::ResolutionMode mode = config::ResolutionMode::kLink;

  std::vector<model::Record>                       records; // accepted, natural id order
  std::vector<RecordRejection>                     rejections;
  std::vector<blocking::BlockingExhaustionWarning> warnings;

  graph::SimilarityGraph          graph;
  model::ClusterAssignment        clusters;
  resolution::ResolutionOutcome   resolution;
  RunStats                        stats;
};

/*
  ResolutionEngine

  Owns one batch run:

      records -> Normalizer -> Blocker -> PairScorer (per block)
              -> SimilarityGraph -> ClusterExtractor
              -> MasterEntityBuilder -> ResolutionStrategy

  Normalization and per-block scoring fan out to a worker pool; the
  calling thread is the only writer of the graph and merges task results
  in input order (normalization) and block-key order (scoring).

  The configuration is validated at construction, before any record is
  seen.
*/
class ResolutionEngine {
 public:
  explicit ResolutionEngine(config::ResolutionConfig config);

  RunResult Run(const std::vector<model::Record>& input) const;

  const config::ResolutionConfig& Config() const {
    return config_;
  }

 private:
  std::vector<model::Record> Accept(const std::vector<model::Record>& input, std::vector<RecordRejection>& rejections) const;
  RunResult                  Execute(const std::vector<model::Record>& input) const;

  config::ResolutionConfig config_;
  normalize::Normalizer    normalizer_;
  blocking::Blocker        blocker_;
  scoring::PairScorer      scorer_;
};

} // namespace resolver::core
