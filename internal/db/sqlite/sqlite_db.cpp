#include "sqlite_db.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/migrations.hpp"

namespace chronicle::db::sqlite {

namespace {

ErrorCode CodeFor(int rc) {
  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED: return ErrorCode::Busy;
    case SQLITE_CONSTRAINT: return ErrorCode::ConstraintViolation;
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_FULL: return ErrorCode::IOError;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB: return ErrorCode::Corruption;
    default: return ErrorCode::InternalError;
  }
}

void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw DbError(CodeFor(rc), std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec("BEGIN IMMEDIATE;");
    try {
      db_.Exec(sql);
      db_.Exec("COMMIT;");
    } catch (const DbError&) {
      db_.Exec("ROLLBACK;");
      throw;
    }
  }

  int AppliedVersion() override {
    sqlite3_stmt* st = nullptr;
    ThrowIf(sqlite3_prepare_v2(db_.Handle(), "SELECT COALESCE(MAX(version),0) FROM schema_migrations;", -1, &st, nullptr),
            db_.Handle(), "sqlite prepare");

    int version = 0;
    int rc      = sqlite3_step(st);
    if (rc == SQLITE_ROW) version = sqlite3_column_int(st, 0);
    sqlite3_finalize(st);

    if (rc != SQLITE_ROW) ThrowIf(rc, db_.Handle(), "schema_migrations");
    return version;
  }

 private:
  SqliteDB& db_;
};

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw DbError(CodeFor(rc), path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw DbError(CodeFor(rc), msg);
  }
}

void SqliteDB::Configure() {
  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");

  // NORMAL is a good tradeoff; use FULL if you want stronger durability
  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

int SqliteDB::Migrate() {
  std::scoped_lock        lock(tx_mutex_);
  SqliteMigrationExecutor executor(*this);
  return sql::RunMigrations(executor, sql::SqliteMigrations());
}

} // namespace chronicle::db::sqlite
