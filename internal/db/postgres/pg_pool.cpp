#include "pg_pool.hpp"

#include <utility>

namespace resolver::db::postgres {

namespace {

struct PreparedStatement {
  const char* name;
  const char* sql;
};

// Names used by PgRepository with exec_prepared.
constexpr PreparedStatement kStatements[] = {
    {"insert_record", "INSERT INTO records(id,name,email,phone,address,postal_code) VALUES($1,$2,$3,$4,$5,$6)"},
    {"insert_record_attribute", "INSERT INTO record_attributes(record_id,key,value) VALUES($1,$2,$3)"},
    {"get_record", "SELECT id,name,email,phone,address,postal_code FROM records WHERE id=$1"},
    {"get_record_attributes", "SELECT key,value FROM record_attributes WHERE record_id=$1"},
    {"delete_record", "DELETE FROM records WHERE id=$1"},
    {"upsert_normalized_value",
     "INSERT INTO normalized_values(record_id,field,raw_value,normalized_value,present) VALUES($1,$2,$3,$4,$5) "
     "ON CONFLICT(record_id,field) DO UPDATE SET raw_value=EXCLUDED.raw_value,normalized_value=EXCLUDED.normalized_value,"
     "present=EXCLUDED.present"},
    {"get_normalized_value", "SELECT raw_value,normalized_value,present FROM normalized_values WHERE record_id=$1 AND field=$2"},
    {"insert_edge", "INSERT INTO similarity_edges(left_id,right_id,score) VALUES($1,$2,$3)"},
    {"insert_edge_field_score", "INSERT INTO edge_field_scores(left_id,right_id,field,score) VALUES($1,$2,$3,$4)"},
    {"insert_cluster", "INSERT INTO clusters(cluster_id) VALUES($1)"},
    {"insert_cluster_member", "INSERT INTO cluster_members(cluster_id,record_id) VALUES($1,$2)"},
    {"insert_master", "INSERT INTO master_entities(id,cluster_id) VALUES($1,$2)"},
    {"insert_master_value", "INSERT INTO master_values(master_id,field,value,representative,source_record_id) VALUES($1,$2,$3,$4,$5)"},
    {"insert_master_member", "INSERT INTO master_members(master_id,record_id) VALUES($1,$2)"},
    {"insert_assignment", "INSERT INTO assignments(record_id,master_id) VALUES($1,$2)"},
    {"insert_same_as_link", "INSERT INTO same_as_links(left_id,right_id,cluster_id) VALUES($1,$2,$3)"},
};

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  available_.wait(lock, [this] { return !idle_.empty() || opened_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Lease(std::move(conn));
  }

  // connect outside the lock; the slot is reserved first
  ++opened_;
  lock.unlock();
  try {
    return Lease(Open());
  } catch (...) {
    {
      std::lock_guard relock(mutex_);
      --opened_;
    }
    available_.notify_one();
    throw;
  }
}

void PgPool::ApplySchema(const std::vector<std::string>& statements) {
  auto       conn = Acquire();
  pqxx::work work(*conn);
  for (const auto& sql : statements) work.exec(sql);
  work.commit();
}

std::unique_ptr<pqxx::connection> PgPool::Open() {
  auto conn = std::make_unique<pqxx::connection>(conninfo_);
  for (const auto& statement : kStatements) conn->prepare(statement.name, statement.sql);
  return conn;
}

std::shared_ptr<pqxx::connection> PgPool::Lease(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> pool = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [pool](pqxx::connection* leased) {
    if (auto self = pool.lock()) {
      self->GiveBack(leased);
    } else {
      delete leased;
    }
  });
}

void PgPool::GiveBack(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  available_.notify_one();
}

} // namespace resolver::db::postgres
