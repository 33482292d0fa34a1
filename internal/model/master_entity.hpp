#pragma once

#include <array>
#include <string>
#include <vector>

#include "internal/model/cluster.hpp"
#include "internal/model/field.hpp"

namespace resolver::model {

struct CanonicalValue {
  std::string value;          // normalized
  std::string representative; // raw value of the lowest-id member carrying value
  std::string source_record_id;
};

/*
  Canonical entity for one cluster.

  Members point at the master through assignments; the master never owns
  its members.
*/
struct MasterEntity {
  std::string                             id;
  ClusterId                               cluster_id = 0;
  std::array<CanonicalValue, kFieldCount> values;
  std::vector<std::string>                member_ids;

  const CanonicalValue& Value(FieldType field) const {
    return values[Index(field)];
  }
};

struct Assignment {
  std::string record_id;
  std::string master_id;
};

struct SameAsLink {
  std::string left_id;
  std::string right_id;
  ClusterId   cluster_id = 0;
};

} // namespace resolver::model
