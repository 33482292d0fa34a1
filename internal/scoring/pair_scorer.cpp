#include "pair_scorer.hpp"

#include <algorithm>

#include "internal/model/record_id.hpp"
#include "internal/scoring/string_metrics.hpp"

namespace resolver::scoring {

PairScorer::PairScorer(config::ScoringOptions options) : options_(std::move(options)) {
}

model::SimilarityEdge PairScorer::Score(const model::NormalizedRecord& a, const model::NormalizedRecord& b) const {
  const bool swapped = model::CompareRecordIds(b.id, a.id) < 0;
  const auto& left   = swapped ? b : a;
  const auto& right  = swapped ? a : b;

  model::SimilarityEdge edge;
  edge.left_id  = left.id;
  edge.right_id = right.id;

  double weighted = 0.0;
  double weights  = 0.0;
  for (const auto& field : options_.fields) {
    if (!left.Has(field.field) || !right.Has(field.field)) {
      if (options_.missing_field_policy == config::MissingFieldPolicy::kZero) {
        weights += field.weight;
      }
      continue;
    }

    const double similarity                        = Similarity(field.metric, left.Value(field.field), right.Value(field.field));
    edge.field_scores[model::Index(field.field)] = similarity;
    weighted += field.weight * similarity;
    weights += field.weight;
  }

  if (weights > 0.0) {
    edge.score = std::clamp(weighted / weights, 0.0, 1.0);
  }
  return edge;
}

std::optional<model::SimilarityEdge> PairScorer::ScoreCandidate(const model::NormalizedRecord& a, const model::NormalizedRecord& b) const {
  auto edge = Score(a, b);
  if (edge.score < options_.low_threshold) return std::nullopt;
  return edge;
}

} // namespace resolver::scoring
