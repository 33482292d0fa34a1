#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "internal/model/record_id.hpp"

namespace resolver::model {

using ClusterId = std::uint64_t;

struct Cluster {
  ClusterId                id = 0;
  std::vector<std::string> members; // natural id order
};

/*
  Output of cluster extraction.

  clusters partition the records that kept at least one edge at or above
  the high-confidence threshold (plus promoted singletons). singletons lists
  the remaining records in natural id order.
*/
struct ClusterAssignment {
  std::vector<Cluster>                                 clusters;
  std::vector<std::string>                             singletons;
  std::map<std::string, ClusterId, RecordIdLess>       cluster_of;
};

} // namespace resolver::model
