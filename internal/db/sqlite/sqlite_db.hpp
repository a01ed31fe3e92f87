#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace chronicle::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection per process. Transactions take TxMutex() for their whole
  lifetime, so a transaction never interleaves with another on the shared
  handle; BEGIN IMMEDIATE then serializes against other processes.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  // Create or upgrade the event store tables. Returns migrations applied.
  int Migrate();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace chronicle::db::sqlite
