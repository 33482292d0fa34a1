#include "master_entity_builder.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/util/uuid.hpp"

namespace resolver::resolution {

namespace {

struct Tally {
  std::string                    value;
  std::size_t                    votes = 0;
  const model::NormalizedRecord* first = nullptr; // lowest id carrying value
};

bool PluralityOnly(model::FieldType field) {
  return field != model::FieldType::kEmail && field != model::FieldType::kPhone;
}

} // namespace

MasterEntityBuilder::MasterEntityBuilder(std::uint64_t seed) : seed_(seed) {
}

model::CanonicalValue MasterEntityBuilder::Canonical(model::FieldType field, const std::vector<const model::NormalizedRecord*>& members) {
  // tallies keep first-seen order, members arrive in natural id order
  std::vector<Tally> tallies;
  for (const auto* member : members) {
    if (!member->Has(field)) continue;

    const auto& value = member->Value(field);
    auto        it    = std::find_if(tallies.begin(), tallies.end(), [&](const Tally& t) { return t.value == value; });
    if (it == tallies.end()) {
      tallies.push_back(Tally{value, 1, member});
    } else {
      ++it->votes;
    }
  }
  if (tallies.empty()) return {};

  const Tally* winner = &tallies.front();
  bool         strict = true;
  for (const auto& tally : tallies) {
    if (&tally == winner) continue;
    if (tally.votes > winner->votes) {
      winner = &tally;
      strict = true;
    } else if (tally.votes == winner->votes) {
      strict = false;
    }
  }

  if (!strict && !PluralityOnly(field)) {
    winner = &tallies.front();
    for (const auto& tally : tallies) {
      if (tally.value.size() > winner->value.size()) winner = &tally;
    }
  }

  model::CanonicalValue out;
  out.value            = winner->value;
  out.representative   = winner->first->Field(field).raw;
  out.source_record_id = winner->first->id;
  return out;
}

std::vector<model::MasterEntity> MasterEntityBuilder::Build(const std::vector<model::Cluster>& clusters, const graph::SimilarityGraph& graph) const {
  util::SeededUuidGenerator        ids(seed_);
  std::vector<model::MasterEntity> masters;
  masters.reserve(clusters.size());

  for (const auto& cluster : clusters) {
    std::vector<const model::NormalizedRecord*> members;
    members.reserve(cluster.members.size());
    for (const auto& id : cluster.members) {
      const auto* node = graph.Node(id);
      if (!node) throw std::out_of_range("cluster member not in graph: " + id);
      members.push_back(node);
    }

    model::MasterEntity master;
    master.id         = ids.Next();
    master.cluster_id = cluster.id;
    master.member_ids = cluster.members;
    for (auto field : model::kAllFields) {
      master.values[model::Index(field)] = Canonical(field, members);
    }
    masters.push_back(std::move(master));
  }
  return masters;
}

} // namespace resolver::resolution
