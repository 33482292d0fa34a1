#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <ranges>
#include <string>
#include <vector>

#include "internal/model/record.hpp"
#include "internal/model/record_id.hpp"
#include "internal/model/similarity_edge.hpp"

namespace resolver::graph {

struct PairKeyLess {
  bool operator()(const model::PairKey& a, const model::PairKey& b) const {
    if (const int c = model::CompareRecordIds(a.first, b.first); c != 0) return c < 0;
    return model::CompareRecordIds(a.second, b.second) < 0;
  }
};

/*
  SimilarityGraph

  Nodes are normalized records, edges are unordered scored pairs with at
  most one edge per pair. Built by a single writer, then treated as
  read-only by cluster extraction.

  Iteration order is always natural record id order, so every consumer
  sees the same sequence on every run.
*/
class SimilarityGraph {
 public:
  using Adjacency = std::map<std::string, double, model::RecordIdLess>;

  // Returns false when a node with the same id already exists.
  bool AddNode(model::NormalizedRecord record);

  /*
    Upsert. A second edge for the same pair replaces the first only when
    its aggregate score is higher. Self loops and edges touching unknown
    nodes are rejected (returns false).
  */
  bool AddEdge(model::SimilarityEdge edge);

  bool HasNode(const std::string& id) const {
    return nodes_.contains(id);
  }

  const model::NormalizedRecord* Node(const std::string& id) const;

  const model::SimilarityEdge* Edge(const std::string& a, const std::string& b) const;

  // Adjacent ids in natural order. Empty for unknown or isolated nodes.
  auto Neighbors(const std::string& id) const {
    auto it = adjacency_.find(id);
    return std::views::keys(it == adjacency_.end() ? kNoNeighbors : it->second);
  }

  // Neighbor id -> aggregate score.
  const Adjacency& WeightedNeighbors(const std::string& id) const;

  std::vector<model::SimilarityEdge> AllEdges() const;
  std::vector<model::SimilarityEdge> EdgesAtOrAbove(double threshold) const;

  std::vector<std::string> NodeIds() const;

  const std::map<std::string, model::NormalizedRecord, model::RecordIdLess>& Nodes() const {
    return nodes_;
  }

  std::size_t NodeCount() const {
    return nodes_.size();
  }

  std::size_t EdgeCount() const {
    return edges_.size();
  }

 private:
  static const Adjacency kNoNeighbors;

  std::map<std::string, model::NormalizedRecord, model::RecordIdLess> nodes_;
  std::map<model::PairKey, model::SimilarityEdge, PairKeyLess>        edges_;
  std::map<std::string, Adjacency, model::RecordIdLess>               adjacency_;
};

} // namespace resolver::graph
