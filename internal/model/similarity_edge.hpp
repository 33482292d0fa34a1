#pragma once

#include <array>
#include <optional>
#include <string>
#include <utility>

#include "internal/model/field.hpp"
#include "internal/model/record_id.hpp"

namespace resolver::model {

/*
  Undirected similarity edge.

  left_id < right_id in natural id order. A field score is absent when
  either record lacks the field.
*/
struct SimilarityEdge {
  std::string left_id;
  std::string right_id;

  std::array<std::optional<double>, kFieldCount> field_scores{};
  double                                         score = 0.0;

  const std::optional<double>& FieldScore(FieldType field) const {
    return field_scores[Index(field)];
  }
};

using PairKey = std::pair<std::string, std::string>;

// Canonical key for an unordered pair.
inline PairKey MakePairKey(const std::string& a, const std::string& b) {
  if (CompareRecordIds(a, b) <= 0) return {a, b};
  return {b, a};
}

} // namespace resolver::model
