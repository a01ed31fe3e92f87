#pragma once

#include <string>
#include <vector>

namespace chronicle::db::sql {

/*
  Backend-agnostic schema bootstrap.

  Each backend implements the executor; RunMigrations records applied
  versions in schema_migrations and skips them on the next start.
*/

struct Migration {
  int         version;
  std::string name;
  std::string sql;
};

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  // Runs a multi-statement script atomically.
  virtual void ExecuteSQL(const std::string& sql) = 0;

  // Highest applied migration version, 0 when none.
  virtual int AppliedVersion() = 0;
};

const std::vector<Migration>& SqliteMigrations();
const std::vector<Migration>& PostgresMigrations();

// Returns the number of migrations applied by this call.
int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

} // namespace chronicle::db::sql
