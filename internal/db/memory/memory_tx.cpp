#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace resolver::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (open_) Rollback();
}

void MemoryTransaction::Commit() {
  if (!open_) throw util::PersistenceError("memory transaction is already closed");

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    throw util::PersistenceError("memory transaction conflict: repository changed since version " + std::to_string(base_version_));
  }
  repo_.committed_ = std::move(working_);
  ++repo_.committed_version_;
  open_ = false;
}

void MemoryTransaction::Rollback() {
  working_ = {};
  open_    = false;
}

} // namespace resolver::db::memory
