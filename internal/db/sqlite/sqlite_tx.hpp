#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace chronicle::db::sqlite {

/*
  One append or read unit on the shared connection.

  Holds SqliteDB::TxMutex() from construction until Commit/Rollback, or
  until destruction when neither succeeded, so only one transaction per
  process is open at a time. BEGIN IMMEDIATE takes the
  database write lock up front, which makes the stream version check and
  the event inserts atomic against other processes.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::mutex> lock_;
  bool committed_ = false;
};

}
