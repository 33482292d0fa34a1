#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace resolver::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()), work_(std::make_unique<pqxx::work>(*conn_)), open_(true) {
}

PgTransaction::~PgTransaction() {
  if (!open_) return;
  try {
    work_->abort();
  } catch (const std::exception& e) {
    RESOLVER_LOG_ERROR("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  if (!open_) throw util::PersistenceError("postgres transaction is already closed");
  work_->commit();
  open_ = false;
}

void PgTransaction::Rollback() {
  if (!open_) throw util::PersistenceError("postgres transaction is already closed");
  open_ = false;
  work_->abort();
}

} // namespace resolver::db::postgres
