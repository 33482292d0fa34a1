#pragma once

#include <algorithm>
#include <vector>

#include "internal/model/cluster.hpp"
#include "internal/model/master_entity.hpp"
#include "internal/model/record.hpp"
#include "internal/model/record_id.hpp"
#include "internal/model/similarity_edge.hpp"

namespace resolver::db {

/*
  Canonical List* ordering shared by every backend.

  SQL ORDER BY on TEXT ids is lexicographic ("10" < "2"), so backends sort
  in natural id order after fetching.
*/

inline bool PairLess(const std::string& a1, const std::string& a2, const std::string& b1, const std::string& b2) {
  if (const int c = model::CompareRecordIds(a1, b1); c != 0) return c < 0;
  return model::CompareRecordIds(a2, b2) < 0;
}

inline void SortRecords(std::vector<model::Record>& records) {
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return model::CompareRecordIds(a.id, b.id) < 0; });
}

inline void SortEdges(std::vector<model::SimilarityEdge>& edges) {
  std::sort(edges.begin(), edges.end(), [](const auto& a, const auto& b) { return PairLess(a.left_id, a.right_id, b.left_id, b.right_id); });
}

inline void SortClusters(std::vector<model::Cluster>& clusters) {
  for (auto& cluster : clusters) std::sort(cluster.members.begin(), cluster.members.end(), model::RecordIdLess{});
  std::sort(clusters.begin(), clusters.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
}

inline void SortMasters(std::vector<model::MasterEntity>& masters) {
  for (auto& master : masters) std::sort(master.member_ids.begin(), master.member_ids.end(), model::RecordIdLess{});
  std::sort(masters.begin(), masters.end(), [](const auto& a, const auto& b) { return a.cluster_id < b.cluster_id; });
}

inline void SortAssignments(std::vector<model::Assignment>& assignments) {
  std::sort(assignments.begin(), assignments.end(), [](const auto& a, const auto& b) { return model::CompareRecordIds(a.record_id, b.record_id) < 0; });
}

inline void SortSameAsLinks(std::vector<model::SameAsLink>& links) {
  std::sort(links.begin(), links.end(), [](const auto& a, const auto& b) { return PairLess(a.left_id, a.right_id, b.left_id, b.right_id); });
}

} // namespace resolver::db
