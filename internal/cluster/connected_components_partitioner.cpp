#include "connected_components_partitioner.hpp"

#include <map>
#include <numeric>
#include <unordered_map>

#include "internal/config/resolution_config.hpp"

namespace resolver::cluster {

namespace {

std::size_t Find(std::vector<std::size_t>& parent, std::size_t node) {
  while (parent[node] != node) {
    parent[node] = parent[parent[node]];
    node         = parent[node];
  }
  return node;
}

} // namespace

std::string_view ConnectedComponentsPartitioner::Name() const {
  return config::kConnectedComponents;
}

Communities ConnectedComponentsPartitioner::Partition(const graph::SimilarityGraph& graph, std::uint64_t) const {
  const auto ids = graph.NodeIds();

  std::unordered_map<std::string, std::size_t> index;
  for (std::size_t i = 0; i < ids.size(); ++i) index.emplace(ids[i], i);

  std::vector<std::size_t> parent(ids.size());
  std::iota(parent.begin(), parent.end(), 0);

  for (const auto& edge : graph.AllEdges()) {
    const auto a = Find(parent, index.at(edge.left_id));
    const auto b = Find(parent, index.at(edge.right_id));
    // lower index becomes the root so roots follow natural order
    if (a < b) {
      parent[b] = a;
    } else if (b < a) {
      parent[a] = b;
    }
  }

  std::map<std::size_t, std::vector<std::string>> grouped;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    grouped[Find(parent, i)].push_back(ids[i]);
  }

  Communities communities;
  communities.reserve(grouped.size());
  for (auto& [root, members] : grouped) communities.push_back(std::move(members));
  return communities;
}

} // namespace resolver::cluster
