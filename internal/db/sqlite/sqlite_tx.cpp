#include "sqlite_tx.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"

namespace chronicle::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      CHRONICLE_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
  if (lock_.owns_lock()) lock_.unlock();
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  committed_ = true;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const DbError&) {
    lock_.unlock();
    throw;
  }
  lock_.unlock();
}

} // namespace chronicle::db::sqlite
