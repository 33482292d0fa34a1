#include "similarity_graph.hpp"

namespace resolver::graph {

const SimilarityGraph::Adjacency SimilarityGraph::kNoNeighbors{};

bool SimilarityGraph::AddNode(model::NormalizedRecord record) {
  auto id = record.id;
  return nodes_.emplace(std::move(id), std::move(record)).second;
}

bool SimilarityGraph::AddEdge(model::SimilarityEdge edge) {
  if (model::CompareRecordIds(edge.left_id, edge.right_id) == 0) return false;
  if (!nodes_.contains(edge.left_id) || !nodes_.contains(edge.right_id)) return false;

  auto key = model::MakePairKey(edge.left_id, edge.right_id);
  if (key.first != edge.left_id) std::swap(edge.left_id, edge.right_id);

  auto it = edges_.find(key);
  if (it != edges_.end() && it->second.score >= edge.score) return false;

  adjacency_[key.first][key.second] = edge.score;
  adjacency_[key.second][key.first] = edge.score;
  if (it != edges_.end()) {
    it->second = std::move(edge);
  } else {
    edges_.emplace(std::move(key), std::move(edge));
  }
  return true;
}

const model::NormalizedRecord* SimilarityGraph::Node(const std::string& id) const {
  auto it = nodes_.find(id);
  return it == nodes_.end() ? nullptr : &it->second;
}

const model::SimilarityEdge* SimilarityGraph::Edge(const std::string& a, const std::string& b) const {
  auto it = edges_.find(model::MakePairKey(a, b));
  return it == edges_.end() ? nullptr : &it->second;
}

const SimilarityGraph::Adjacency& SimilarityGraph::WeightedNeighbors(const std::string& id) const {
  auto it = adjacency_.find(id);
  return it == adjacency_.end() ? kNoNeighbors : it->second;
}

std::vector<model::SimilarityEdge> SimilarityGraph::AllEdges() const {
  std::vector<model::SimilarityEdge> out;
  out.reserve(edges_.size());
  for (const auto& [key, edge] : edges_) out.push_back(edge);
  return out;
}

std::vector<model::SimilarityEdge> SimilarityGraph::EdgesAtOrAbove(double threshold) const {
  std::vector<model::SimilarityEdge> out;
  for (const auto& [key, edge] : edges_) {
    if (edge.score >= threshold) out.push_back(edge);
  }
  return out;
}

std::vector<std::string> SimilarityGraph::NodeIds() const {
  std::vector<std::string> ids;
  ids.reserve(nodes_.size());
  for (const auto& [id, record] : nodes_) ids.push_back(id);
  return ids;
}

} // namespace resolver::graph
