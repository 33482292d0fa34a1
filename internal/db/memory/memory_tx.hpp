#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace resolver::db::memory {

/*
  Works on a private copy of the committed state. Commit swaps the copy in
  and fails with util::PersistenceError when another transaction committed
  since the copy was taken; the result writer never interleaves runs, so a
  conflict means two writers share one repository.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsOpen() const override {
    return open_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  std::uint64_t           base_version_ = 0;
  bool                    open_         = true;
};

} // namespace resolver::db::memory
