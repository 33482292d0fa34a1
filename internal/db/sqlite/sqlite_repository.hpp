#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace resolver::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace resolver::db::sqlite
