#pragma once

namespace resolver::db {

/*
  Unit of work for one result write.

  Every backend gives the same guarantees to the result writer:

  - nothing written through the transaction is visible before Commit()
  - Rollback(), or destroying an open transaction, leaves the store as it
    was when Begin() returned
  - Commit() and Rollback() close the transaction; a closed transaction
    must not be reused

  memory    copy of the committed state, swapped in on commit
  sqlite    BEGIN IMMEDIATE on the shared handle
  postgres  pqxx::work on a pooled connection
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  // false once Commit() or Rollback() has run
  virtual bool IsOpen() const = 0;
};

} // namespace resolver::db
