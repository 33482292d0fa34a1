#include "sqlite_repository.hpp"

#include <map>

#include "internal/db/api/ordering.hpp"

namespace resolver::db::sqlite {

using resolver::db::ErrorCode;
using resolver::db::Result;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

std::string FieldName(model::FieldType field) {
  return std::string(model::ToString(field));
}

model::Record ReadRecordRow(sqlite3_stmt* st) {
  model::Record r;
  r.id          = ColText(st, 0);
  r.name        = ColOptionalText(st, 1);
  r.email       = ColOptionalText(st, 2);
  r.phone       = ColOptionalText(st, 3);
  r.address     = ColOptionalText(st, 4);
  r.postal_code = ColOptionalText(st, 5);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Records
// ------------------------------------------------------------------

Result SqliteRepository::InsertRecord(Transaction& t, const model::Record& r) {
  auto* db = TX(t).Handle();

  if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "record id is empty");

  Statement st(db, "INSERT INTO records(id,name,email,phone,address,postal_code) VALUES(?,?,?,?,?,?);");
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  BindText(st.Get(), 1, r.id);
  BindOptionalText(st.Get(), 2, r.name);
  BindOptionalText(st.Get(), 3, r.email);
  BindOptionalText(st.Get(), 4, r.phone);
  BindOptionalText(st.Get(), 5, r.address);
  BindOptionalText(st.Get(), 6, r.postal_code);

  int rc = st.Step();
  if (rc != SQLITE_DONE) {
    if ((rc & 0xff) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "record " + r.id + " already exists");
    return Translate(db, rc);
  }

  Statement attr(db, "INSERT INTO record_attributes(record_id,key,value) VALUES(?,?,?);");
  if (!attr.Ok()) return Translate(db, attr.PrepareCode());
  for (const auto& [key, value] : r.attributes) {
    BindText(attr.Get(), 1, r.id);
    BindText(attr.Get(), 2, key);
    BindText(attr.Get(), 3, value);
    rc = attr.Step();
    if (rc != SQLITE_DONE) return Translate(db, rc);
    attr.Reset();
  }
  return Result::Ok();
}

std::optional<model::Record> SqliteRepository::GetRecord(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT id,name,email,phone,address,postal_code FROM records WHERE id=?;");
  if (!st.Ok()) return std::nullopt;
  BindText(st.Get(), 1, id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  auto r = ReadRecordRow(st.Get());

  Statement attr(db, "SELECT key,value FROM record_attributes WHERE record_id=?;");
  if (!attr.Ok()) return r;
  BindText(attr.Get(), 1, id);
  while (attr.Step() == SQLITE_ROW) {
    r.attributes.emplace(ColText(attr.Get(), 0), ColText(attr.Get(), 1));
  }
  return r;
}

std::vector<model::Record> SqliteRepository::ListRecords(Transaction& t) {
  auto* db = TX(t).Handle();

  std::vector<model::Record> out;
  Statement                  st(db, "SELECT id,name,email,phone,address,postal_code FROM records;");
  if (!st.Ok()) return out;
  while (st.Step() == SQLITE_ROW) out.push_back(ReadRecordRow(st.Get()));

  std::map<std::string, std::map<std::string, std::string>> attributes;
  Statement                                                 attr(db, "SELECT record_id,key,value FROM record_attributes;");
  if (attr.Ok()) {
    while (attr.Step() == SQLITE_ROW) {
      attributes[ColText(attr.Get(), 0)].emplace(ColText(attr.Get(), 1), ColText(attr.Get(), 2));
    }
  }
  for (auto& r : out) {
    if (auto it = attributes.find(r.id); it != attributes.end()) r.attributes = std::move(it->second);
  }

  SortRecords(out);
  return out;
}

Result SqliteRepository::DeleteRecords(Transaction& t, const std::vector<std::string>& ids) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM records WHERE id=?;");
  if (!st.Ok()) return Translate(db, st.PrepareCode());
  for (const auto& id : ids) {
    BindText(st.Get(), 1, id);
    int rc = st.Step();
    if (rc != SQLITE_DONE) return Translate(db, rc);
    st.Reset();
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Normalization
// ------------------------------------------------------------------

Result SqliteRepository::UpsertNormalizedValue(Transaction& t, const std::string& record_id, model::FieldType field, const model::NormalizedField& value) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO normalized_values(record_id,field,raw_value,normalized_value,present) VALUES(?,?,?,?,?)"
               " ON CONFLICT(record_id,field) DO UPDATE SET"
               " raw_value=excluded.raw_value,"
               " normalized_value=excluded.normalized_value,"
               " present=excluded.present;");
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  BindText(st.Get(), 1, record_id);
  BindText(st.Get(), 2, FieldName(field));
  BindText(st.Get(), 3, value.raw);
  BindText(st.Get(), 4, value.value);
  sqlite3_bind_int(st.Get(), 5, value.present ? 1 : 0);
  return Translate(db, st.Step());
}

std::optional<model::NormalizedField> SqliteRepository::GetNormalizedValue(Transaction& t, const std::string& record_id, model::FieldType field) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT raw_value,normalized_value,present FROM normalized_values WHERE record_id=? AND field=?;");
  if (!st.Ok()) return std::nullopt;
  BindText(st.Get(), 1, record_id);
  BindText(st.Get(), 2, FieldName(field));
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  model::NormalizedField out;
  out.raw     = ColText(st.Get(), 0);
  out.value   = ColText(st.Get(), 1);
  out.present = sqlite3_column_int(st.Get(), 2) != 0;
  return out;
}

// ------------------------------------------------------------------
// Similarity graph
// ------------------------------------------------------------------

Result SqliteRepository::ReplaceEdges(Transaction& t, const std::vector<model::SimilarityEdge>& edges) {
  auto* db = TX(t).Handle();

  for (const char* sql : {"DELETE FROM edge_field_scores;", "DELETE FROM similarity_edges;"}) {
    Statement clear(db, sql);
    if (!clear.Ok()) return Translate(db, clear.PrepareCode());
    if (auto rc = clear.Step(); rc != SQLITE_DONE) return Translate(db, rc);
  }

  Statement edge_st(db, "INSERT INTO similarity_edges(left_id,right_id,score) VALUES(?,?,?);");
  Statement field_st(db, "INSERT INTO edge_field_scores(left_id,right_id,field,score) VALUES(?,?,?,?);");
  if (!edge_st.Ok()) return Translate(db, edge_st.PrepareCode());
  if (!field_st.Ok()) return Translate(db, field_st.PrepareCode());

  for (const auto& edge : edges) {
    BindText(edge_st.Get(), 1, edge.left_id);
    BindText(edge_st.Get(), 2, edge.right_id);
    BindDouble(edge_st.Get(), 3, edge.score);
    if (auto rc = edge_st.Step(); rc != SQLITE_DONE) return Translate(db, rc);
    edge_st.Reset();

    for (auto field : model::kAllFields) {
      const auto& score = edge.FieldScore(field);
      if (!score) continue;
      BindText(field_st.Get(), 1, edge.left_id);
      BindText(field_st.Get(), 2, edge.right_id);
      BindText(field_st.Get(), 3, FieldName(field));
      BindDouble(field_st.Get(), 4, *score);
      if (auto rc = field_st.Step(); rc != SQLITE_DONE) return Translate(db, rc);
      field_st.Reset();
    }
  }
  return Result::Ok();
}

std::vector<model::SimilarityEdge> SqliteRepository::ListEdges(Transaction& t) {
  auto* db = TX(t).Handle();

  std::map<model::PairKey, model::SimilarityEdge> by_pair;
  Statement                                       st(db, "SELECT left_id,right_id,score FROM similarity_edges;");
  if (!st.Ok()) return {};
  while (st.Step() == SQLITE_ROW) {
    model::SimilarityEdge edge;
    edge.left_id  = ColText(st.Get(), 0);
    edge.right_id = ColText(st.Get(), 1);
    edge.score    = ColDouble(st.Get(), 2);
    by_pair.emplace(model::PairKey{edge.left_id, edge.right_id}, std::move(edge));
  }

  Statement fields(db, "SELECT left_id,right_id,field,score FROM edge_field_scores;");
  if (fields.Ok()) {
    while (fields.Step() == SQLITE_ROW) {
      auto it    = by_pair.find({ColText(fields.Get(), 0), ColText(fields.Get(), 1)});
      auto field = model::FieldFromString(ColText(fields.Get(), 2));
      if (it == by_pair.end() || !field) continue;
      it->second.field_scores[model::Index(*field)] = ColDouble(fields.Get(), 3);
    }
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

Result SqliteRepository::ReplaceClusters(Transaction& t, const std::vector<model::Cluster>& clusters) {
  auto* db = TX(t).Handle();

  for (const char* sql : {"DELETE FROM cluster_members;", "DELETE FROM clusters;"}) {
    Statement clear(db, sql);
    if (!clear.Ok()) return Translate(db, clear.PrepareCode());
    if (auto rc = clear.Step(); rc != SQLITE_DONE) return Translate(db, rc);
  }

  Statement cluster_st(db, "INSERT INTO clusters(cluster_id) VALUES(?);");
  Statement member_st(db, "INSERT INTO cluster_members(cluster_id,record_id) VALUES(?,?);");
  if (!cluster_st.Ok()) return Translate(db, cluster_st.PrepareCode());
  if (!member_st.Ok()) return Translate(db, member_st.PrepareCode());

  for (const auto& cluster : clusters) {
    BindU64(cluster_st.Get(), 1, cluster.id);
    if (auto rc = cluster_st.Step(); rc != SQLITE_DONE) return Translate(db, rc);
    cluster_st.Reset();

    for (const auto& member : cluster.members) {
      BindU64(member_st.Get(), 1, cluster.id);
      BindText(member_st.Get(), 2, member);
      if (auto rc = member_st.Step(); rc != SQLITE_DONE) return Translate(db, rc);
      member_st.Reset();
    }
  }
  return Result::Ok();
}

std::vector<model::Cluster> SqliteRepository::ListClusters(Transaction& t) {
  auto* db = TX(t).Handle();

  std::map<model::ClusterId, model::Cluster> by_id;
  Statement                                  st(db, "SELECT cluster_id FROM clusters;");
  if (!st.Ok()) return {};
  while (st.Step() == SQLITE_ROW) {
    const auto id = ColU64(st.Get(), 0);
    by_id[id].id  = id;
  }

  Statement members(db, "SELECT cluster_id,record_id FROM cluster_members;");
  if (members.Ok()) {
    while (members.Step() == SQLITE_ROW) {
      auto it = by_id.find(ColU64(members.Get(), 0));
      if (it != by_id.end()) it->second.members.push_back(ColText(members.Get(), 1));
    }
  }

  std::vector<model::Cluster> out;
  for (auto& [_, cluster] : by_id) out.push_back(std::move(cluster));
  SortClusters(out);
  return out;
}

Result SqliteRepository::ReplaceMasterEntities(Transaction& t, const std::vector<model::MasterEntity>& masters) {
  auto* db = TX(t).Handle();

  for (const char* sql : {"DELETE FROM master_values;", "DELETE FROM master_members;", "DELETE FROM master_entities;"}) {
    Statement clear(db, sql);
    if (!clear.Ok()) return Translate(db, clear.PrepareCode());
    if (auto rc = clear.Step(); rc != SQLITE_DONE) return Translate(db, rc);
  }

  Statement master_st(db, "INSERT INTO master_entities(id,cluster_id) VALUES(?,?);");
  Statement value_st(db, "INSERT INTO master_values(master_id,field,value,representative,source_record_id) VALUES(?,?,?,?,?);");
  Statement member_st(db, "INSERT INTO master_members(master_id,record_id) VALUES(?,?);");
  if (!master_st.Ok()) return Translate(db, master_st.PrepareCode());
  if (!value_st.Ok()) return Translate(db, value_st.PrepareCode());
  if (!member_st.Ok()) return Translate(db, member_st.PrepareCode());

  for (const auto& master : masters) {
    BindText(master_st.Get(), 1, master.id);
    BindU64(master_st.Get(), 2, master.cluster_id);
    if (auto rc = master_st.Step(); rc != SQLITE_DONE) return Translate(db, rc);
    master_st.Reset();

    for (auto field : model::kAllFields) {
      const auto& value = master.Value(field);
      if (value.value.empty()) continue;
      BindText(value_st.Get(), 1, master.id);
      BindText(value_st.Get(), 2, FieldName(field));
      BindText(value_st.Get(), 3, value.value);
      BindText(value_st.Get(), 4, value.representative);
      BindText(value_st.Get(), 5, value.source_record_id);
      if (auto rc = value_st.Step(); rc != SQLITE_DONE) return Translate(db, rc);
      value_st.Reset();
    }

    for (const auto& member : master.member_ids) {
      BindText(member_st.Get(), 1, master.id);
      BindText(member_st.Get(), 2, member);
      if (auto rc = member_st.Step(); rc != SQLITE_DONE) return Translate(db, rc);
      member_st.Reset();
    }
  }
  return Result::Ok();
}

std::vector<model::MasterEntity> SqliteRepository::ListMasterEntities(Transaction& t) {
  auto* db = TX(t).Handle();

  std::map<std::string, model::MasterEntity> by_id;
  Statement                                  st(db, "SELECT id,cluster_id FROM master_entities;");
  if (!st.Ok()) return {};
  while (st.Step() == SQLITE_ROW) {
    model::MasterEntity master;
    master.id         = ColText(st.Get(), 0);
    master.cluster_id = ColU64(st.Get(), 1);
    by_id.emplace(master.id, std::move(master));
  }

  Statement values(db, "SELECT master_id,field,value,representative,source_record_id FROM master_values;");
  if (values.Ok()) {
    while (values.Step() == SQLITE_ROW) {
      auto it    = by_id.find(ColText(values.Get(), 0));
      auto field = model::FieldFromString(ColText(values.Get(), 1));
      if (it == by_id.end() || !field) continue;
      auto& slot            = it->second.values[model::Index(*field)];
      slot.value            = ColText(values.Get(), 2);
      slot.representative   = ColText(values.Get(), 3);
      slot.source_record_id = ColText(values.Get(), 4);
    }
  }

  Statement members(db, "SELECT master_id,record_id FROM master_members;");
  if (members.Ok()) {
    while (members.Step() == SQLITE_ROW) {
      auto it = by_id.find(ColText(members.Get(), 0));
      if (it != by_id.end()) it->second.member_ids.push_back(ColText(members.Get(), 1));
    }
  }

  std::vector<model::MasterEntity> out;
  for (auto& [_, master] : by_id) out.push_back(std::move(master));
  SortMasters(out);
  return out;
}

Result SqliteRepository::ReplaceAssignments(Transaction& t, const std::vector<model::Assignment>& assignments) {
  auto* db = TX(t).Handle();

  Statement clear(db, "DELETE FROM assignments;");
  if (!clear.Ok()) return Translate(db, clear.PrepareCode());
  if (auto rc = clear.Step(); rc != SQLITE_DONE) return Translate(db, rc);

  Statement st(db, "INSERT INTO assignments(record_id,master_id) VALUES(?,?);");
  if (!st.Ok()) return Translate(db, st.PrepareCode());
  for (const auto& a : assignments) {
    BindText(st.Get(), 1, a.record_id);
    BindText(st.Get(), 2, a.master_id);
    if (auto rc = st.Step(); rc != SQLITE_DONE) return Translate(db, rc);
    st.Reset();
  }
  return Result::Ok();
}

std::vector<model::Assignment> SqliteRepository::ListAssignments(Transaction& t) {
  auto* db = TX(t).Handle();

  std::vector<model::Assignment> out;
  Statement                      st(db, "SELECT record_id,master_id FROM assignments;");
  if (!st.Ok()) return out;
  while (st.Step() == SQLITE_ROW) out.push_back({ColText(st.Get(), 0), ColText(st.Get(), 1)});
  SortAssignments(out);
  return out;
}

Result SqliteRepository::ReplaceSameAsLinks(Transaction& t, const std::vector<model::SameAsLink>& links) {
  auto* db = TX(t).Handle();

  Statement clear(db, "DELETE FROM same_as_links;");
  if (!clear.Ok()) return Translate(db, clear.PrepareCode());
  if (auto rc = clear.Step(); rc != SQLITE_DONE) return Translate(db, rc);

  Statement st(db, "INSERT INTO same_as_links(left_id,right_id,cluster_id) VALUES(?,?,?);");
  if (!st.Ok()) return Translate(db, st.PrepareCode());
  for (const auto& link : links) {
    BindText(st.Get(), 1, link.left_id);
    BindText(st.Get(), 2, link.right_id);
    BindU64(st.Get(), 3, link.cluster_id);
    if (auto rc = st.Step(); rc != SQLITE_DONE) return Translate(db, rc);
    st.Reset();
  }
  return Result::Ok();
}

std::vector<model::SameAsLink> SqliteRepository::ListSameAsLinks(Transaction& t) {
  auto* db = TX(t).Handle();

  std::vector<model::SameAsLink> out;
  Statement                      st(db, "SELECT left_id,right_id,cluster_id FROM same_as_links;");
  if (!st.Ok()) return out;
  while (st.Step() == SQLITE_ROW) out.push_back({ColText(st.Get(), 0), ColText(st.Get(), 1), ColU64(st.Get(), 2)});
  SortSameAsLinks(out);
  return out;
}

} // namespace resolver::db::sqlite
