#pragma once

#include <memory>

#include "internal/cluster/partitioner.hpp"
#include "internal/config/resolution_config.hpp"
#include "internal/graph/similarity_graph.hpp"
#include "internal/model/cluster.hpp"

namespace resolver::cluster {

/*
  Builds the configured partitioner. An unknown algorithm name falls back
  to connected components and logs a warning.
*/
std::unique_ptr<Partitioner> MakePartitioner(const config::ClusteringOptions& options);

/*
  ClusterExtractor

      graph
        -> edges with score >= high_threshold
        -> Partitioner::Partition(filtered, seed)
        -> clusters (size >= 2) + singletons

  Clusters are ordered by their lowest member and numbered from 1.
  Singleton promotion turns every singleton into a size-1 cluster.
*/
class ClusterExtractor {
 public:
  explicit ClusterExtractor(config::ClusteringOptions options);
  ClusterExtractor(config::ClusteringOptions options, std::unique_ptr<Partitioner> partitioner);

  model::ClusterAssignment Extract(const graph::SimilarityGraph& graph) const;

  const Partitioner& ActivePartitioner() const {
    return *partitioner_;
  }

 private:
  Communities RunPartitioner(const graph::SimilarityGraph& filtered) const;

  config::ClusteringOptions    options_;
  std::unique_ptr<Partitioner> partitioner_;
};

// Subgraph with the edges at or above threshold and the nodes they touch.
graph::SimilarityGraph FilterGraph(const graph::SimilarityGraph& graph, double threshold);

} // namespace resolver::cluster
