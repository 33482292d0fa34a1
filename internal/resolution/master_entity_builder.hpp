#pragma once

#include <cstdint>
#include <vector>

#include "internal/graph/similarity_graph.hpp"
#include "internal/model/cluster.hpp"
#include "internal/model/master_entity.hpp"
#include "internal/model/record.hpp"

namespace resolver::resolution {

/*
  MasterEntityBuilder

  Canonical value per field and cluster:

      name, address, postal_code   plurality, tie -> value of the lowest id
      email, phone                 strict plurality, else the longest value,
                                   tie -> value of the lowest id

  Empty values never vote. Master ids are UUIDv4 drawn from one generator
  seeded per Build call, in cluster order.
*/
class MasterEntityBuilder {
 public:
  explicit MasterEntityBuilder(std::uint64_t seed);

  // members must be in natural id order
  static model::CanonicalValue Canonical(model::FieldType field, const std::vector<const model::NormalizedRecord*>& members);

  // Looks members up in graph. Every member must be a graph node.
  std::vector<model::MasterEntity> Build(const std::vector<model::Cluster>& clusters, const graph::SimilarityGraph& graph) const;

 private:
  std::uint64_t seed_;
};

} // namespace resolver::resolution
