#include "louvain_partitioner.hpp"

#include <map>
#include <numeric>
#include <random>
#include <unordered_map>
#include <utility>

#include "internal/config/resolution_config.hpp"

namespace resolver::cluster {

namespace {

constexpr double kGainEpsilon = 1e-12;

// Weighted graph for one level. Self loops are not stored: a node's
// internal weight moves with it and never changes a move gain.
struct LevelGraph {
  std::vector<std::vector<std::pair<std::size_t, double>>> adj;
  std::vector<double>                                      degree;
};

std::vector<std::size_t> ShuffledOrder(std::size_t n, std::mt19937_64& rng) {
  std::vector<std::size_t> order(n);
  std::iota(order.begin(), order.end(), 0);
  for (std::size_t i = n; i > 1; --i) {
    const std::size_t j = static_cast<std::size_t>(rng() % i);
    std::swap(order[i - 1], order[j]);
  }
  return order;
}

/*
  One local-moving phase. community[i] is a community label in [0, n).
  Returns true when at least one node changed community.
*/
bool MoveNodes(const LevelGraph& g, double m2, double resolution, std::uint32_t max_sweeps, std::mt19937_64& rng, std::vector<std::size_t>& community) {
  const std::size_t n = g.adj.size();

  std::vector<double> tot(n, 0.0);
  for (std::size_t i = 0; i < n; ++i) tot[community[i]] += g.degree[i];

  const auto gain = [&](std::size_t i, double ki_in, double tot_c) {
    return ki_in / m2 - resolution * g.degree[i] * tot_c / (m2 * m2);
  };

  bool moved_any = false;
  for (std::uint32_t sweep = 0; sweep < max_sweeps; ++sweep) {
    bool moved = false;
    for (auto i : ShuffledOrder(n, rng)) {
      const std::size_t current = community[i];

      std::map<std::size_t, double> neighbor_weights;
      for (const auto& [j, w] : g.adj[i]) neighbor_weights[community[j]] += w;

      tot[current] -= g.degree[i];

      std::size_t best      = current;
      double      best_gain = gain(i, neighbor_weights.contains(current) ? neighbor_weights[current] : 0.0, tot[current]);
      for (const auto& [c, ki_in] : neighbor_weights) {
        const double candidate = gain(i, ki_in, tot[c]);
        if (candidate > best_gain + kGainEpsilon) {
          best_gain = candidate;
          best      = c;
        }
      }

      tot[best] += g.degree[i];
      if (best != current) {
        community[i] = best;
        moved        = true;
      }
    }
    if (!moved) break;
    moved_any = true;
  }
  return moved_any;
}

// Relabels communities 0..k-1 in order of their lowest node.
std::size_t Renumber(std::vector<std::size_t>& community) {
  std::unordered_map<std::size_t, std::size_t> remap;
  for (auto& c : community) {
    auto [it, inserted] = remap.emplace(c, remap.size());
    c                   = it->second;
  }
  return remap.size();
}

LevelGraph Aggregate(const LevelGraph& g, const std::vector<std::size_t>& community, std::size_t count) {
  LevelGraph out;
  out.adj.resize(count);
  out.degree.assign(count, 0.0);

  std::vector<std::map<std::size_t, double>> weights(count);
  for (std::size_t i = 0; i < g.adj.size(); ++i) {
    out.degree[community[i]] += g.degree[i];
    for (const auto& [j, w] : g.adj[i]) {
      if (community[i] != community[j]) weights[community[i]][community[j]] += w;
    }
  }
  for (std::size_t c = 0; c < count; ++c) {
    out.adj[c].assign(weights[c].begin(), weights[c].end());
  }
  return out;
}

} // namespace

LouvainPartitioner::LouvainPartitioner(double resolution, std::uint32_t max_passes) : resolution_(resolution), max_passes_(max_passes) {
}

std::string_view LouvainPartitioner::Name() const {
  return config::kLouvain;
}

Communities LouvainPartitioner::Partition(const graph::SimilarityGraph& graph, std::uint64_t seed) const {
  const auto ids = graph.NodeIds();
  const auto n   = ids.size();
  if (n == 0) return {};

  std::unordered_map<std::string, std::size_t> index;
  for (std::size_t i = 0; i < n; ++i) index.emplace(ids[i], i);

  LevelGraph level;
  level.adj.resize(n);
  level.degree.assign(n, 0.0);
  double m2 = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    for (const auto& [neighbor, score] : graph.WeightedNeighbors(ids[i])) {
      level.adj[i].emplace_back(index.at(neighbor), score);
      level.degree[i] += score;
    }
    m2 += level.degree[i];
  }

  // membership[v] = current level node of original node v
  std::vector<std::size_t> membership(n);
  std::iota(membership.begin(), membership.end(), 0);

  if (m2 > 0.0) {
    std::mt19937_64 rng(seed);
    for (std::uint32_t pass = 0; pass < max_passes_; ++pass) {
      std::vector<std::size_t> community(level.adj.size());
      std::iota(community.begin(), community.end(), 0);

      if (!MoveNodes(level, m2, resolution_, max_passes_, rng, community)) break;

      const auto count = Renumber(community);
      for (auto& m : membership) m = community[m];
      if (count == level.adj.size()) break;
      level = Aggregate(level, community, count);
    }
  }

  std::map<std::size_t, std::vector<std::string>> grouped;
  for (std::size_t v = 0; v < n; ++v) grouped[membership[v]].push_back(ids[v]);

  Communities communities;
  communities.reserve(grouped.size());
  for (auto& [label, members] : grouped) communities.push_back(std::move(members));
  return communities;
}

} // namespace resolver::cluster
