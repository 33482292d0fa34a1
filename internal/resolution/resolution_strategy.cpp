#include "resolution_strategy.hpp"

#include <stdexcept>
#include <unordered_map>

namespace resolver::resolution {

namespace {

std::vector<model::Assignment> AssignmentsFor(const std::vector<model::MasterEntity>& masters) {
  std::vector<model::Assignment> out;
  for (const auto& master : masters) {
    for (const auto& member : master.member_ids) out.push_back({member, master.id});
  }
  return out;
}

void CheckMasters(const model::ClusterAssignment& clusters, const std::vector<model::MasterEntity>& masters) {
  if (clusters.clusters.size() != masters.size()) {
    throw std::invalid_argument("expected one master per cluster, got " + std::to_string(masters.size()) + " for " +
                                std::to_string(clusters.clusters.size()) + " clusters");
  }
}

} // namespace

model::Record MasterRecord(const model::MasterEntity& master, const std::vector<const model::Record*>& members) {
  model::Record record;
  record.id = master.id;
  for (auto field : model::kAllFields) {
    const auto& canonical = master.Value(field);
    if (!canonical.value.empty()) model::MutableRawValue(record, field) = canonical.value;
  }
  for (const auto* member : members) {
    for (const auto& [key, value] : member->attributes) record.attributes.emplace(key, value);
  }
  return record;
}

ResolutionOutcome MergeStrategy::Resolve(const std::vector<model::Record>& records,
                                         const model::ClusterAssignment& clusters,
                                         std::vector<model::MasterEntity> masters) const {
  CheckMasters(clusters, masters);

  std::unordered_map<std::string, const model::Record*> by_id;
  for (const auto& record : records) by_id.emplace(record.id, &record);

  ResolutionOutcome out;
  out.assignments = AssignmentsFor(masters);

  std::unordered_map<model::ClusterId, std::size_t> master_of_cluster;
  for (std::size_t i = 0; i < masters.size(); ++i) master_of_cluster.emplace(masters[i].cluster_id, i);

  // one pass in natural order: a cluster is emitted at its lowest member
  for (const auto& record : records) {
    auto it = clusters.cluster_of.find(record.id);
    if (it == clusters.cluster_of.end()) {
      out.resolved_records.push_back(record);
      continue;
    }

    out.discarded_ids.push_back(record.id);
    const auto& master = masters[master_of_cluster.at(it->second)];
    if (master.member_ids.front() != record.id) continue;

    std::vector<const model::Record*> members;
    for (const auto& id : master.member_ids) members.push_back(by_id.at(id));
    out.resolved_records.push_back(MasterRecord(master, members));
  }

  out.masters = std::move(masters);
  return out;
}

ResolutionOutcome LinkStrategy::Resolve(const std::vector<model::Record>& records,
                                        const model::ClusterAssignment& clusters,
                                        std::vector<model::MasterEntity> masters) const {
  CheckMasters(clusters, masters);

  ResolutionOutcome out;
  out.assignments      = AssignmentsFor(masters);
  out.resolved_records = records;

  for (const auto& cluster : clusters.clusters) {
    for (std::size_t i = 0; i < cluster.members.size(); ++i) {
      for (std::size_t j = i + 1; j < cluster.members.size(); ++j) {
        out.same_as_links.push_back({cluster.members[i], cluster.members[j], cluster.id});
      }
    }
  }

  out.masters = std::move(masters);
  return out;
}

std::unique_ptr<ResolutionStrategy> MakeResolutionStrategy(config::ResolutionMode mode) {
  if (mode == config::ResolutionMode::kMerge) return std::make_unique<MergeStrategy>();
  return std::make_unique<LinkStrategy>();
}

} // namespace resolver::resolution
