#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace resolver::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
  open_ = true;
}

SqliteTransaction::~SqliteTransaction() {
  if (!open_) return;
  try {
    Close("ROLLBACK;");
  } catch (const util::PersistenceError& e) {
    RESOLVER_LOG_ERROR("sqlite rollback failed", {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  Close("COMMIT;");
}

void SqliteTransaction::Rollback() {
  Close("ROLLBACK;");
}

void SqliteTransaction::Close(const char* sql) {
  if (!open_) throw util::PersistenceError("sqlite transaction is already closed");
  // a failed COMMIT leaves sqlite inside the transaction; the destructor rolls it back
  db_->Exec(sql);
  open_ = false;
}

} // namespace resolver::db::sqlite
