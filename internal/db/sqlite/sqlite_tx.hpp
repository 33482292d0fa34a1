#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace resolver::db::sqlite {

/*
  BEGIN IMMEDIATE takes the write lock up front, so a second writer waits
  on the busy timeout instead of failing halfway through a result write.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsOpen() const override {
    return open_;
  }

 private:
  void Close(const char* sql);

  std::shared_ptr<SqliteDB> db_;
  bool                      open_ = false;
};

} // namespace resolver::db::sqlite
