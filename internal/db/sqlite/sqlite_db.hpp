#pragma once

#include <sqlite3.h>

#include <string>
#include <vector>

namespace resolver::db::sqlite {

/*
  Prepared statement owned by one repository call. Reset() rebinds the same
  statement inside a loop. Prepare failures are reported through Ok() and
  PrepareCode() so callers can translate them into a db::Result.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    rc_ = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Ok() const {
    return rc_ == SQLITE_OK;
  }
  int PrepareCode() const {
    return rc_;
  }
  sqlite3_stmt* Get() const {
    return st_;
  }

  int Step() {
    return sqlite3_step(st_);
  }

  void Reset() {
    sqlite3_reset(st_);
    sqlite3_clear_bindings(st_);
  }

 private:
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_OK;
};

/*
  Resolution store file. Opened serialized (FULLMUTEX) since the result
  writer and the CLI share one handle. Failures throw util::PersistenceError.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql) const {
    return Statement(db_, sql.c_str());
  }

  // All statements or none; a half created schema never survives.
  void ApplySchema(const std::vector<std::string>& statements);

 private:
  void ApplyPragmas(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace resolver::db::sqlite
