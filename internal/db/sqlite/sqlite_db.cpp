#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace resolver::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

[[noreturn]] void Fail(const std::string& what, const std::string& detail) {
  throw util::PersistenceError("sqlite " + what + ": " + detail);
}

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    const std::string detail = db_ ? sqlite3_errmsg(db_) : "out of memory";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    Fail("open " + path_, detail);
  }

  try {
    ApplyPragmas(wal_mode);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    const std::string detail = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    Fail("exec", detail);
  }
}

void SqliteDB::ApplySchema(const std::vector<std::string>& statements) {
  Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto& sql : statements) Exec(sql);
    Exec("COMMIT;");
  } catch (...) {
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

void SqliteDB::ApplyPragmas(bool wal_mode) {
  // WAL lets the visualizer read the views while a run is writing
  if (wal_mode) Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // attribute and edge score rows cascade off their parents
  Exec("PRAGMA foreign_keys=ON;");

  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) Fail("busy_timeout", sqlite3_errmsg(db_));
  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace resolver::db::sqlite
