#pragma once

#include <optional>

#include "internal/config/resolution_config.hpp"
#include "internal/model/record.hpp"
#include "internal/model/similarity_edge.hpp"

namespace resolver::scoring {

/*
  PairScorer

  Weighted multi-field similarity for one candidate pair. Symmetric:
  Score(a, b) and Score(b, a) produce the same edge, stored with the lower
  record id on the left.
*/
class PairScorer {
 public:
  explicit PairScorer(config::ScoringOptions options);

  model::SimilarityEdge Score(const model::NormalizedRecord& a, const model::NormalizedRecord& b) const;

  // Score, keeping the edge only when it reaches the low threshold.
  std::optional<model::SimilarityEdge> ScoreCandidate(const model::NormalizedRecord& a, const model::NormalizedRecord& b) const;

  double LowThreshold() const {
    return options_.low_threshold;
  }

 private:
  config::ScoringOptions options_;
};

} // namespace resolver::scoring
