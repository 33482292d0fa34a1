#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/graph/similarity_graph.hpp"

namespace resolver::cluster {

// One community per entry, members in natural id order.
using Communities = std::vector<std::vector<std::string>>;

/*
  Partitioner

  Splits every node of the given graph into disjoint communities. The graph
  passed in holds only the edges that survived the high-confidence filter.
  Implementations must be deterministic for a fixed seed.
*/
class Partitioner {
 public:
  virtual ~Partitioner() = default;

  virtual std::string_view Name() const = 0;

  virtual Communities Partition(const graph::SimilarityGraph& graph, std::uint64_t seed) const = 0;
};

} // namespace resolver::cluster
