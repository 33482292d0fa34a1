#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace resolver::db::postgres {

/*
  Bounded set of connections to the resolution store.

  A pqxx::connection is never shared between threads: Acquire() hands out
  one connection per transaction and blocks once max_connections are
  leased. The returned shared_ptr gives the connection back on release.
  Every new connection has the repository statements prepared on it.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  std::shared_ptr<pqxx::connection> Acquire();

  // Runs the statements in one transaction on a leased connection.
  void ApplySchema(const std::vector<std::string>& statements);

 private:
  std::unique_ptr<pqxx::connection> Open();
  std::shared_ptr<pqxx::connection> Lease(std::unique_ptr<pqxx::connection> conn);
  void                              GiveBack(pqxx::connection* conn);

  const std::string conninfo_;
  const std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        available_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    opened_ = 0;
};

} // namespace resolver::db::postgres
