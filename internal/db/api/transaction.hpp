#pragma once

namespace chronicle::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible to other transactions until Commit()
  - Reads inside the transaction see its own writes
  - Rollback() discards all writes and releases every lock taken
  - Destructor MUST rollback if not committed

  SQLite:   BEGIN IMMEDIATE (single writer)
  Postgres: pqxx::work (row locks via SELECT ... FOR UPDATE)
  Memory:   per-aggregate locks + write set applied at commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() finished
  virtual bool IsCommitted() const = 0;
};

} // namespace chronicle::db
