#pragma once

#include <cstdint>

#include "internal/cluster/partitioner.hpp"

namespace resolver::cluster {

/*
  LouvainPartitioner

  Multi-level modularity optimization over the aggregate edge scores.

      level loop:
          local moving   (nodes visited in a seeded shuffle of natural order)
          aggregation    (each community becomes one node)

  Stops when a level moves no node or after max_passes levels. Inside a
  level, local moving also stops after max_passes sweeps.

  resolution > 1 favours smaller communities, < 1 larger ones.
*/
class LouvainPartitioner final : public Partitioner {
 public:
  LouvainPartitioner(double resolution, std::uint32_t max_passes);

  std::string_view Name() const override;

  Communities Partition(const graph::SimilarityGraph& graph, std::uint64_t seed) const override;

 private:
  double        resolution_;
  std::uint32_t max_passes_;
};

} // namespace resolver::cluster
