#include "cluster_extractor.hpp"

#include <algorithm>

#include "internal/cluster/connected_components_partitioner.hpp"
#include "internal/cluster/louvain_partitioner.hpp"
#include "internal/model/record_id.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace resolver::cluster {

namespace {

void Canonicalize(Communities& communities) {
  for (auto& members : communities) {
    std::sort(members.begin(), members.end(), model::RecordIdLess{});
  }
  std::sort(communities.begin(), communities.end(), [](const auto& a, const auto& b) { return model::CompareRecordIds(a.front(), b.front()) < 0; });
}

} // namespace

std::unique_ptr<Partitioner> MakePartitioner(const config::ClusteringOptions& options) {
  if (options.algorithm == config::kLouvain) {
    return std::make_unique<LouvainPartitioner>(options.louvain_resolution, options.louvain_max_passes);
  }
  if (options.algorithm != config::kConnectedComponents) {
    RESOLVER_LOG_WARN("unknown clustering algorithm, using connected components", {observability::StringField("algorithm", options.algorithm)});
  }
  return std::make_unique<ConnectedComponentsPartitioner>();
}

graph::SimilarityGraph FilterGraph(const graph::SimilarityGraph& graph, double threshold) {
  graph::SimilarityGraph filtered;
  for (auto& edge : graph.EdgesAtOrAbove(threshold)) {
    if (!filtered.HasNode(edge.left_id)) filtered.AddNode(*graph.Node(edge.left_id));
    if (!filtered.HasNode(edge.right_id)) filtered.AddNode(*graph.Node(edge.right_id));
    filtered.AddEdge(std::move(edge));
  }
  return filtered;
}

ClusterExtractor::ClusterExtractor(config::ClusteringOptions options) : options_(std::move(options)), partitioner_(MakePartitioner(options_)) {
}

ClusterExtractor::ClusterExtractor(config::ClusteringOptions options, std::unique_ptr<Partitioner> partitioner)
    : options_(std::move(options)), partitioner_(std::move(partitioner)) {
}

Communities ClusterExtractor::RunPartitioner(const graph::SimilarityGraph& filtered) const {
  auto communities = partitioner_->Partition(filtered, options_.seed);
  Canonicalize(communities);

  if (!options_.verify_determinism) return communities;

  for (std::uint32_t run = 1; run < options_.verification_runs; ++run) {
    auto again = partitioner_->Partition(filtered, options_.seed);
    Canonicalize(again);
    if (again != communities) {
      throw util::ClusteringNondeterminismError(std::string(partitioner_->Name()) + " produced a different partition on verification run " +
                                                std::to_string(run + 1) + " with seed " + std::to_string(options_.seed));
    }
  }
  RESOLVER_LOG_DEBUG("clustering determinism verified",
                     {observability::StringField("algorithm", partitioner_->Name()),
                      observability::IntField("runs", static_cast<std::int64_t>(options_.verification_runs))});
  return communities;
}

model::ClusterAssignment ClusterExtractor::Extract(const graph::SimilarityGraph& graph) const {
  const auto filtered    = FilterGraph(graph, options_.high_threshold);
  const auto communities = RunPartitioner(filtered);

  std::vector<std::vector<std::string>> groups;
  std::vector<std::string>              singletons;
  for (const auto& members : communities) {
    if (members.size() >= 2) {
      groups.push_back(members);
    } else {
      singletons.push_back(members.front());
    }
  }
  for (const auto& id : graph.NodeIds()) {
    if (!filtered.HasNode(id)) singletons.push_back(id);
  }
  std::sort(singletons.begin(), singletons.end(), model::RecordIdLess{});

  if (options_.promote_singletons) {
    for (auto& id : singletons) groups.push_back({std::move(id)});
    singletons.clear();
    std::sort(groups.begin(), groups.end(), [](const auto& a, const auto& b) { return model::CompareRecordIds(a.front(), b.front()) < 0; });
  }

  model::ClusterAssignment out;
  out.singletons = std::move(singletons);
  model::ClusterId next_id = 1;
  for (auto& members : groups) {
    model::Cluster cluster;
    cluster.id      = next_id++;
    cluster.members = std::move(members);
    for (const auto& id : cluster.members) out.cluster_of.emplace(id, cluster.id);
    out.clusters.push_back(std::move(cluster));
  }
  return out;
}

} // namespace resolver::cluster
