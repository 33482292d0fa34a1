#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace resolver::db::postgres {

/*
  pqxx::work on a connection leased from the pool. The lease returns the
  connection to the pool when the transaction is destroyed.
*/
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction() override;

  pqxx::work& Work() {
    return *work_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsOpen() const override {
    return open_;
  }

 private:
  // declared first so the work is destroyed before its connection
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;
  bool                              open_ = false;
};

} // namespace resolver::db::postgres
