#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace resolver::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                       InsertRecord(Transaction&, const model::Record&) override;
  std::optional<model::Record> GetRecord(Transaction&, const std::string&) override;
  std::vector<model::Record>   ListRecords(Transaction&) override;
  Result                       DeleteRecords(Transaction&, const std::vector<std::string>&) override;

  Result UpsertNormalizedValue(Transaction&, const std::string&, model::FieldType, const model::NormalizedField&) override;
  std::optional<model::NormalizedField> GetNormalizedValue(Transaction&, const std::string&, model::FieldType) override;

  Result                             ReplaceEdges(Transaction&, const std::vector<model::SimilarityEdge>&) override;
  std::vector<model::SimilarityEdge> ListEdges(Transaction&) override;

  Result                           ReplaceClusters(Transaction&, const std::vector<model::Cluster>&) override;
  std::vector<model::Cluster>      ListClusters(Transaction&) override;
  Result                           ReplaceMasterEntities(Transaction&, const std::vector<model::MasterEntity>&) override;
  std::vector<model::MasterEntity> ListMasterEntities(Transaction&) override;
  Result                           ReplaceAssignments(Transaction&, const std::vector<model::Assignment>&) override;
  std::vector<model::Assignment>   ListAssignments(Transaction&) override;
  Result                           ReplaceSameAsLinks(Transaction&, const std::vector<model::SameAsLink>&) override;
  std::vector<model::SameAsLink>   ListSameAsLinks(Transaction&) override;

 private:
  friend class MemoryTransaction;

  using NormalizedSlots = std::array<std::optional<model::NormalizedField>, model::kFieldCount>;

  struct State {
    std::map<std::string, model::Record, model::RecordIdLess>   records;
    std::map<std::string, NormalizedSlots, model::RecordIdLess> normalized;

    std::vector<model::SimilarityEdge> edges;
    std::vector<model::Cluster>        clusters;
    std::vector<model::MasterEntity>   masters;
    std::vector<model::Assignment>     assignments;
    std::vector<model::SameAsLink>     same_as_links;
  };

  std::mutex    mutex_;
  State         committed_;
  std::uint64_t committed_version_ = 0;
};

} // namespace resolver::db::memory
