#include "pg_repository.hpp"

#include <map>

#include "internal/db/api/ordering.hpp"

namespace resolver::db::postgres {

namespace {

std::optional<std::string> OptionalText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

std::string FieldName(model::FieldType field) {
  return std::string(model::ToString(field));
}

model::Record ReadRecordRow(const pqxx::row& row) {
  model::Record r;
  r.id          = row[0].c_str();
  r.name        = OptionalText(row[1]);
  r.email       = OptionalText(row[2]);
  r.phone       = OptionalText(row[3]);
  r.address     = OptionalText(row[4]);
  r.postal_code = OptionalText(row[5]);
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Records
// ------------------------------------------------------------------

Result PgRepository::InsertRecord(Transaction& t, const model::Record& r) {
  if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "record id is empty");
  try {
    auto& work = TX(t).Work();
    work.exec_prepared("insert_record", r.id, r.name, r.email, r.phone, r.address, r.postal_code);
    for (const auto& [key, value] : r.attributes) {
      work.exec_prepared("insert_record_attribute", r.id, key, value);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::Record> PgRepository::GetRecord(Transaction& t, const std::string& id) {
  auto& work = TX(t).Work();
  auto  res  = work.exec_prepared("get_record", id);
  if (res.empty()) return std::nullopt;

  auto r = ReadRecordRow(res[0]);
  for (const auto& row : work.exec_prepared("get_record_attributes", id)) {
    r.attributes.emplace(row[0].c_str(), row[1].c_str());
  }
  return r;
}

std::vector<model::Record> PgRepository::ListRecords(Transaction& t) {
  auto& work = TX(t).Work();

  std::vector<model::Record> out;
  for (const auto& row : work.exec("SELECT id,name,email,phone,address,postal_code FROM records;")) {
    out.push_back(ReadRecordRow(row));
  }

  std::map<std::string, std::map<std::string, std::string>> attributes;
  for (const auto& row : work.exec("SELECT record_id,key,value FROM record_attributes;")) {
    attributes[row[0].c_str()].emplace(row[1].c_str(), row[2].c_str());
  }
  for (auto& r : out) {
    if (auto it = attributes.find(r.id); it != attributes.end()) r.attributes = std::move(it->second);
  }

  SortRecords(out);
  return out;
}

Result PgRepository::DeleteRecords(Transaction& t, const std::vector<std::string>& ids) {
  try {
    auto& work = TX(t).Work();
    for (const auto& id : ids) work.exec_prepared("delete_record", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Normalization
// ------------------------------------------------------------------

Result PgRepository::UpsertNormalizedValue(Transaction& t, const std::string& record_id, model::FieldType field, const model::NormalizedField& value) {
  try {
    TX(t).Work().exec_prepared("upsert_normalized_value", record_id, FieldName(field), value.raw, value.value, value.present);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::NormalizedField> PgRepository::GetNormalizedValue(Transaction& t, const std::string& record_id, model::FieldType field) {
  auto res = TX(t).Work().exec_prepared("get_normalized_value", record_id, FieldName(field));
  if (res.empty()) return std::nullopt;

  model::NormalizedField out;
  out.raw     = res[0][0].c_str();
  out.value   = res[0][1].c_str();
  out.present = res[0][2].as<bool>();
  return out;
}

// ------------------------------------------------------------------
// Similarity graph
// ------------------------------------------------------------------

Result PgRepository::ReplaceEdges(Transaction& t, const std::vector<model::SimilarityEdge>& edges) {
  try {
    auto& work = TX(t).Work();
    work.exec("DELETE FROM edge_field_scores;");
    work.exec("DELETE FROM similarity_edges;");
    for (const auto& edge : edges) {
      work.exec_prepared("insert_edge", edge.left_id, edge.right_id, edge.score);
      for (auto field : model::kAllFields) {
        if (const auto& score = edge.FieldScore(field)) {
          work.exec_prepared("insert_edge_field_score", edge.left_id, edge.right_id, FieldName(field), *score);
        }
      }
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SimilarityEdge> PgRepository::ListEdges(Transaction& t) {
  auto& work = TX(t).Work();

  std::map<model::PairKey, model::SimilarityEdge> by_pair;
  for (const auto& row : work.exec("SELECT left_id,right_id,score FROM similarity_edges;")) {
    model::SimilarityEdge edge;
    edge.left_id  = row[0].c_str();
    edge.right_id = row[1].c_str();
    edge.score    = row[2].as<double>();
    by_pair.emplace(model::PairKey{edge.left_id, edge.right_id}, std::move(edge));
  }
  for (const auto& row : work.exec("SELECT left_id,right_id,field,score FROM edge_field_scores;")) {
    auto it    = by_pair.find({row[0].c_str(), row[1].c_str()});
    auto field = model::FieldFromString(row[2].c_str());
    if (it == by_pair.end() || !field) continue;
    it->second.field_scores[model::Index(*field)] = row[3].as<double>();
  }

  std::vector<model::SimilarityEdge> out;
  out.reserve(by_pair.size());
  for (auto& [_, edge] : by_pair) out.push_back(std::move(edge));
  SortEdges(out);
  return out;
}

// ------------------------------------------------------------------
// Resolution
// ------------------------------------------------------------------

Result PgRepository::ReplaceClusters(Transaction& t, const std::vector<model::Cluster>& clusters) {
  try {
    auto& work = TX(t).Work();
    work.exec("DELETE FROM cluster_members;");
    work.exec("DELETE FROM clusters;");
    for (const auto& cluster : clusters) {
      const auto id = static_cast<std::int64_t>(cluster.id);
      work.exec_prepared("insert_cluster", id);
      for (const auto& member : cluster.members) work.exec_prepared("insert_cluster_member", id, member);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::Cluster> PgRepository::ListClusters(Transaction& t) {
  auto& work = TX(t).Work();

  std::map<model::ClusterId, model::Cluster> by_id;
  for (const auto& row : work.exec("SELECT cluster_id FROM clusters;")) {
    const auto id = static_cast<model::ClusterId>(row[0].as<std::int64_t>());
    by_id[id].id  = id;
  }
  for (const auto& row : work.exec("SELECT cluster_id,record_id FROM cluster_members;")) {
    auto it = by_id.find(static_cast<model::ClusterId>(row[0].as<std::int64_t>()));
    if (it != by_id.end()) it->second.members.emplace_back(row[1].c_str());
  }

  std::vector<model::Cluster> out;
  for (auto& [_, cluster] : by_id) out.push_back(std::move(cluster));
  SortClusters(out);
  return out;
}

Result PgRepository::ReplaceMasterEntities(Transaction& t, const std::vector<model::MasterEntity>& masters) {
  try {
    auto& work = TX(t).Work();
    work.exec("DELETE FROM master_values;");
    work.exec("DELETE FROM master_members;");
    work.exec("DELETE FROM master_entities;");
    for (const auto& master : masters) {
      work.exec_prepared("insert_master", master.id, static_cast<std::int64_t>(master.cluster_id));
      for (auto field : model::kAllFields) {
        const auto& value = master.Value(field);
        if (value.value.empty()) continue;
        work.exec_prepared("insert_master_value", master.id, FieldName(field), value.value, value.representative, value.source_record_id);
      }
      for (const auto& member : master.member_ids) work.exec_prepared("insert_master_member", master.id, member);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::MasterEntity> PgRepository::ListMasterEntities(Transaction& t) {
  auto& work = TX(t).Work();

  std::map<std::string, model::MasterEntity> by_id;
  for (const auto& row : work.exec("SELECT id,cluster_id FROM master_entities;")) {
    model::MasterEntity master;
    master.id         = row[0].c_str();
    master.cluster_id = static_cast<model::ClusterId>(row[1].as<std::int64_t>());
    by_id.emplace(master.id, std::move(master));
  }
  for (const auto& row : work.exec("SELECT master_id,field,value,representative,source_record_id FROM master_values;")) {
    auto it    = by_id.find(row[0].c_str());
    auto field = model::FieldFromString(row[1].c_str());
    if (it == by_id.end() || !field) continue;
    auto& slot            = it->second.values[model::Index(*field)];
    slot.value            = row[2].c_str();
    slot.representative   = row[3].c_str();
    slot.source_record_id = row[4].c_str();
  }
  for (const auto& row : work.exec("SELECT master_id,record_id FROM master_members;")) {
    auto it = by_id.find(row[0].c_str());
    if (it != by_id.end()) it->second.member_ids.emplace_back(row[1].c_str());
  }

  std::vector<model::MasterEntity> out;
  for (auto& [_, master] : by_id) out.push_back(std::move(master));
  SortMasters(out);
  return out;
}

Result PgRepository::ReplaceAssignments(Transaction& t, const std::vector<model::Assignment>& assignments) {
  try {
    auto& work = TX(t).Work();
    work.exec("DELETE FROM assignments;");
    for (const auto& a : assignments) work.exec_prepared("insert_assignment", a.record_id, a.master_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::Assignment> PgRepository::ListAssignments(Transaction& t) {
  std::vector<model::Assignment> out;
  for (const auto& row : TX(t).Work().exec("SELECT record_id,master_id FROM assignments;")) {
    out.push_back({row[0].c_str(), row[1].c_str()});
  }
  SortAssignments(out);
  return out;
}

Result PgRepository::ReplaceSameAsLinks(Transaction& t, const std::vector<model::SameAsLink>& links) {
  try {
    auto& work = TX(t).Work();
    work.exec("DELETE FROM same_as_links;");
    for (const auto& link : links) {
      work.exec_prepared("insert_same_as_link", link.left_id, link.right_id, static_cast<std::int64_t>(link.cluster_id));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SameAsLink> PgRepository::ListSameAsLinks(Transaction& t) {
  std::vector<model::SameAsLink> out;
  for (const auto& row : TX(t).Work().exec("SELECT left_id,right_id,cluster_id FROM same_as_links;")) {
    out.push_back({row[0].c_str(), row[1].c_str(), static_cast<model::ClusterId>(row[2].as<std::int64_t>())});
  }
  SortSameAsLinks(out);
  return out;
}

} // namespace resolver::db::postgres
