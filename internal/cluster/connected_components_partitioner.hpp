#pragma once

#include "internal/cluster/partitioner.hpp"

namespace resolver::cluster {

/*
  Union-find over the surviving edges. Ignores the seed.
*/
class ConnectedComponentsPartitioner final : public Partitioner {
 public:
  std::string_view Name() const override;

  Communities Partition(const graph::SimilarityGraph& graph, std::uint64_t seed) const override;
};

} // namespace resolver::cluster
