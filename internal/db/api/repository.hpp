#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/cluster.hpp"
#include "internal/model/field.hpp"
#include "internal/model/master_entity.hpp"
#include "internal/model/record.hpp"
#include "internal/model/similarity_edge.hpp"

namespace resolver::db {

/*
  Repository abstraction.

  GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Replace* calls swap the whole previous result set for the new one
  - List* calls return rows in natural record id order (clusters by id)

  The resolution core never sees this interface; the record source reads
  through it and the result writer persists one run in one transaction.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Records
  // ---------------------------------------------------------------------

  virtual Result InsertRecord(Transaction&, const model::Record&) = 0;

  virtual std::optional<model::Record> GetRecord(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::Record> ListRecords(Transaction&) = 0;

  // Missing ids are ignored.
  virtual Result DeleteRecords(Transaction&, const std::vector<std::string>& ids) = 0;

  // ---------------------------------------------------------------------
  // Normalization
  // ---------------------------------------------------------------------

  virtual Result UpsertNormalizedValue(Transaction&, const std::string& record_id, model::FieldType field, const model::NormalizedField& value) = 0;

  virtual std::optional<model::NormalizedField> GetNormalizedValue(Transaction&, const std::string& record_id, model::FieldType field) = 0;

  // ---------------------------------------------------------------------
  // Similarity graph
  // ---------------------------------------------------------------------

  virtual Result ReplaceEdges(Transaction&, const std::vector<model::SimilarityEdge>& edges) = 0;

  virtual std::vector<model::SimilarityEdge> ListEdges(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Resolution
  // ---------------------------------------------------------------------

  virtual Result ReplaceClusters(Transaction&, const std::vector<model::Cluster>& clusters) = 0;

  virtual std::vector<model::Cluster> ListClusters(Transaction&) = 0;

  virtual Result ReplaceMasterEntities(Transaction&, const std::vector<model::MasterEntity>& masters) = 0;

  virtual std::vector<model::MasterEntity> ListMasterEntities(Transaction&) = 0;

  virtual Result ReplaceAssignments(Transaction&, const std::vector<model::Assignment>& assignments) = 0;

  virtual std::vector<model::Assignment> ListAssignments(Transaction&) = 0;

  virtual Result ReplaceSameAsLinks(Transaction&, const std::vector<model::SameAsLink>& links) = 0;

  virtual std::vector<model::SameAsLink> ListSameAsLinks(Transaction&) = 0;
};

} // namespace resolver::db
