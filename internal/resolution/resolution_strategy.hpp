#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/config/resolution_config.hpp"
#include "internal/model/cluster.hpp"
#include "internal/model/master_entity.hpp"
#include "internal/model/record.hpp"

namespace resolver::resolution {

/*
  Result of applying a resolution mode to one run.

  merge:  resolved_records = one record per cluster (id = master id) plus
          every unclustered record; discarded_ids = clustered members.
  link:   resolved_records = every input record; same_as_links holds one
          link per member pair inside each cluster.

  Both modes emit one assignment per clustered member.
*/
struct ResolutionOutcome {
  std::vector<model::MasterEntity> masters;
  std::vector<model::Assignment>   assignments;
  std::vector<model::SameAsLink>   same_as_links;
  std::vector<model::Record>       resolved_records;
  std::vector<std::string>         discarded_ids;
};

class ResolutionStrategy {
 public:
  virtual ~ResolutionStrategy() = default;

  virtual config::ResolutionMode Mode() const = 0;

  /*
    records: the accepted input records in natural id order.
    masters: one per cluster, same order as clusters.clusters.
  */
  virtual ResolutionOutcome Resolve(const std::vector<model::Record>& records,
                                    const model::ClusterAssignment& clusters,
                                    std::vector<model::MasterEntity> masters) const = 0;
};

class MergeStrategy final : public ResolutionStrategy {
 public:
  config::ResolutionMode Mode() const override {
    return config::ResolutionMode::kMerge;
  }

  ResolutionOutcome Resolve(const std::vector<model::Record>& records,
                            const model::ClusterAssignment& clusters,
                            std::vector<model::MasterEntity> masters) const override;
};

class LinkStrategy final : public ResolutionStrategy {
 public:
  config::ResolutionMode Mode() const override {
    return config::ResolutionMode::kLink;
  }

  ResolutionOutcome Resolve(const std::vector<model::Record>& records,
                            const model::ClusterAssignment& clusters,
                            std::vector<model::MasterEntity> masters) const override;
};

std::unique_ptr<ResolutionStrategy> MakeResolutionStrategy(config::ResolutionMode mode);

// Record carrying the master's canonical values. Attributes are the union
// of the members' attributes, the lowest member id winning on conflicts.
model::Record MasterRecord(const model::MasterEntity& master, const std::vector<const model::Record*>& members);

} // namespace resolver::resolution
