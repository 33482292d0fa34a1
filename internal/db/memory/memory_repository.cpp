#include "memory_repository.hpp"

#include "internal/db/api/ordering.hpp"
#include "memory_tx.hpp"

namespace resolver::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Records
// ------------------------------------------------------------------

Result MemoryRepository::InsertRecord(Transaction& t, const model::Record& r) {
  auto& s = TX(t).Mutable();
  if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "record id is empty");
  if (s.records.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "record " + r.id + " already exists");
  s.records.emplace(r.id, r);
  return Result::Ok();
}

std::optional<model::Record> MemoryRepository::GetRecord(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.records.find(id);
  if (it == s.records.end()) return std::nullopt;
  return it->second;
}

std::vector<model::Record> MemoryRepository::ListRecords(Transaction& t) {
  const auto&                s = TX(t).View();
  std::vector<model::Record> records;
  records.reserve(s.records.size());
  for (const auto& [_, record] : s.records) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::DeleteRecords(Transaction& t, const std::vector<std::string>& ids) {
  auto& s = TX(t).Mutable();
  for (const auto& id : ids) s.records.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Normalization
// ------------------------------------------------------------------

Result MemoryRepository::UpsertNormalizedValue(Transaction& t, const std::string& record_id, model::FieldType field, const model::NormalizedField& value) {
  TX(t).Mutable().normalized[record_id][model::Index(field)] = value;
  return Result::Ok();
}

std::optional<model::NormalizedField> MemoryRepository::GetNormalizedValue(Transaction& t, const std::string& record_id, model::FieldType field) {
  const auto& s  = TX(t).View();
  auto        it = s.normalized.find(record_id);
  if (it == s.normalized.end()) return std::nullopt;
  return it->second[model::Index(field)];
}

// ------------------------------------------------------------------
// Similarity graph
// ------------------------------------------------------------------

Result MemoryRepository::ReplaceEdges(Transaction& t, const std::vector<model::SimilarityEdge>& edges) {
  auto& s = TX(t).Mutable();
  s.edges = edges;
  SortEdges(s.edges);
  return Result::Ok();
}

std::vector<model::SimilarityEdge> MemoryRepository::ListEdges(Transaction& t) {
  return TX(t).View().edges;
}

// ------------------------------------------------------------------
// Resolution
// ------------------------------------------------------------------

Result MemoryRepository::ReplaceClusters(Transaction& t, const std::vector<model::Cluster>& clusters) {
  auto& s    = TX(t).Mutable();
  s.clusters = clusters;
  SortClusters(s.clusters);
  return Result::Ok();
}

std::vector<model::Cluster> MemoryRepository::ListClusters(Transaction& t) {
  return TX(t).View().clusters;
}

Result MemoryRepository::ReplaceMasterEntities(Transaction& t, const std::vector<model::MasterEntity>& masters) {
  auto& s   = TX(t).Mutable();
  s.masters = masters;
  SortMasters(s.masters);
  return Result::Ok();
}

std::vector<model::MasterEntity> MemoryRepository::ListMasterEntities(Transaction& t) {
  return TX(t).View().masters;
}

Result MemoryRepository::ReplaceAssignments(Transaction& t, const std::vector<model::Assignment>& assignments) {
  auto& s       = TX(t).Mutable();
  s.assignments = assignments;
  SortAssignments(s.assignments);
  return Result::Ok();
}

std::vector<model::Assignment> MemoryRepository::ListAssignments(Transaction& t) {
  return TX(t).View().assignments;
}

Result MemoryRepository::ReplaceSameAsLinks(Transaction& t, const std::vector<model::SameAsLink>& links) {
  auto& s         = TX(t).Mutable();
  s.same_as_links = links;
  SortSameAsLinks(s.same_as_links);
  return Result::Ok();
}

std::vector<model::SameAsLink> MemoryRepository::ListSameAsLinks(Transaction& t) {
  return TX(t).View().same_as_links;
}

} // namespace resolver::db::memory
