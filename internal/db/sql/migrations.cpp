#include "migrations.hpp"

#include <stdexcept>

#include "internal/util/time.hpp"

namespace chronicle::db::sql {

namespace {

constexpr const char* kCreateMigrationsTable =
    "CREATE TABLE IF NOT EXISTS schema_migrations ("
    " version INTEGER PRIMARY KEY,"
    " name TEXT NOT NULL,"
    " applied_at_ms BIGINT NOT NULL);";

} // namespace

const std::vector<Migration>& SqliteMigrations() {
  static const std::vector<Migration> migrations = {
      {1, "event_store",
       "CREATE TABLE IF NOT EXISTS event_stream ("
       " stream_id TEXT PRIMARY KEY,"
       " aggregate_type TEXT NOT NULL,"
       " aggregate_id TEXT NOT NULL,"
       " version INTEGER NOT NULL DEFAULT 0,"
       " created_at_ms INTEGER NOT NULL,"
       " updated_at_ms INTEGER NOT NULL,"
       " UNIQUE (aggregate_type, aggregate_id));"
       "CREATE TABLE IF NOT EXISTS domain_event ("
       " global_sequence INTEGER PRIMARY KEY AUTOINCREMENT,"
       " event_id TEXT NOT NULL UNIQUE,"
       " stream_id TEXT NOT NULL REFERENCES event_stream(stream_id),"
       " event_type TEXT NOT NULL,"
       " event_schema_version INTEGER NOT NULL DEFAULT 1,"
       " aggregate_version INTEGER NOT NULL,"
       " payload TEXT NOT NULL,"
       " metadata TEXT NOT NULL DEFAULT '',"
       " occurred_at_ms INTEGER NOT NULL,"
       " causation_id TEXT,"
       " correlation_id TEXT,"
       " user_id TEXT,"
       " UNIQUE (stream_id, aggregate_version));"
       "CREATE INDEX IF NOT EXISTS idx_domain_event_correlation ON domain_event(correlation_id);"},
      {2, "projection_position",
       "CREATE TABLE IF NOT EXISTS projection_position ("
       " projection_name TEXT PRIMARY KEY,"
       " last_event_id TEXT,"
       " last_global_sequence INTEGER,"
       " events_processed INTEGER NOT NULL DEFAULT 0,"
       " last_processed_at_ms INTEGER NOT NULL DEFAULT 0);"},
      {3, "product_view",
       "CREATE TABLE IF NOT EXISTS product_view ("
       " id TEXT PRIMARY KEY,"
       " sku TEXT NOT NULL DEFAULT '',"
       " name TEXT NOT NULL DEFAULT '',"
       " description TEXT NOT NULL DEFAULT '',"
       " price_cents INTEGER NOT NULL DEFAULT 0,"
       " price_display TEXT NOT NULL DEFAULT '',"
       " status TEXT NOT NULL DEFAULT 'DRAFT',"
       " search_text TEXT NOT NULL DEFAULT '',"
       " aggregate_version INTEGER NOT NULL DEFAULT 0,"
       " last_event_id TEXT,"
       " created_at_ms INTEGER NOT NULL DEFAULT 0,"
       " updated_at_ms INTEGER NOT NULL DEFAULT 0,"
       " deleted INTEGER NOT NULL DEFAULT 0);"
       "CREATE INDEX IF NOT EXISTS idx_product_view_status ON product_view(status);"
       "CREATE INDEX IF NOT EXISTS idx_product_view_sku ON product_view(sku);"
       "CREATE INDEX IF NOT EXISTS idx_product_view_name ON product_view(name);"
       "CREATE INDEX IF NOT EXISTS idx_product_view_price ON product_view(price_cents);"},
  };
  return migrations;
}

const std::vector<Migration>& PostgresMigrations() {
  static const std::vector<Migration> migrations = {
      {1, "event_store",
       "CREATE TABLE IF NOT EXISTS event_stream ("
       " stream_id TEXT PRIMARY KEY,"
       " aggregate_type TEXT NOT NULL,"
       " aggregate_id TEXT NOT NULL,"
       " version BIGINT NOT NULL DEFAULT 0,"
       " created_at_ms BIGINT NOT NULL,"
       " updated_at_ms BIGINT NOT NULL,"
       " UNIQUE (aggregate_type, aggregate_id));"
       "CREATE TABLE IF NOT EXISTS domain_event ("
       " global_sequence BIGSERIAL PRIMARY KEY,"
       " event_id TEXT NOT NULL UNIQUE,"
       " stream_id TEXT NOT NULL REFERENCES event_stream(stream_id),"
       " event_type TEXT NOT NULL,"
       " event_schema_version INTEGER NOT NULL DEFAULT 1,"
       " aggregate_version BIGINT NOT NULL,"
       " payload TEXT NOT NULL,"
       " metadata TEXT NOT NULL DEFAULT '',"
       " occurred_at_ms BIGINT NOT NULL,"
       " causation_id TEXT,"
       " correlation_id TEXT,"
       " user_id TEXT,"
       " UNIQUE (stream_id, aggregate_version));"
       "CREATE INDEX IF NOT EXISTS idx_domain_event_correlation ON domain_event(correlation_id);"},
      {2, "projection_position",
       "CREATE TABLE IF NOT EXISTS projection_position ("
       " projection_name TEXT PRIMARY KEY,"
       " last_event_id TEXT,"
       " last_global_sequence BIGINT,"
       " events_processed BIGINT NOT NULL DEFAULT 0,"
       " last_processed_at_ms BIGINT NOT NULL DEFAULT 0);"},
      {3, "product_view",
       "CREATE TABLE IF NOT EXISTS product_view ("
       " id TEXT PRIMARY KEY,"
       " sku TEXT NOT NULL DEFAULT '',"
       " name TEXT NOT NULL DEFAULT '',"
       " description TEXT NOT NULL DEFAULT '',"
       " price_cents BIGINT NOT NULL DEFAULT 0,"
       " price_display TEXT NOT NULL DEFAULT '',"
       " status TEXT NOT NULL DEFAULT 'DRAFT',"
       " search_text TEXT NOT NULL DEFAULT '',"
       " aggregate_version BIGINT NOT NULL DEFAULT 0,"
       " last_event_id TEXT,"
       " created_at_ms BIGINT NOT NULL DEFAULT 0,"
       " updated_at_ms BIGINT NOT NULL DEFAULT 0,"
       " deleted BOOLEAN NOT NULL DEFAULT FALSE);"
       "CREATE INDEX IF NOT EXISTS idx_product_view_status ON product_view(status);"
       "CREATE INDEX IF NOT EXISTS idx_product_view_sku ON product_view(sku);"
       "CREATE INDEX IF NOT EXISTS idx_product_view_name ON product_view(name);"
       "CREATE INDEX IF NOT EXISTS idx_product_view_price ON product_view(price_cents);"},
  };
  return migrations;
}

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  executor.ExecuteSQL(kCreateMigrationsTable);

  const int applied = executor.AppliedVersion();
  int       count   = 0;
  int       last    = 0;

  for (const auto& m : ordered) {
    if (m.version <= last) {
      throw std::logic_error("migrations out of order at version " + std::to_string(m.version));
    }
    last = m.version;
    if (m.version <= applied) continue;

    // name is a compile-time constant above, never user input
    executor.ExecuteSQL(m.sql + "INSERT INTO schema_migrations(version,name,applied_at_ms) VALUES(" +
                        std::to_string(m.version) + ",'" + m.name + "'," + std::to_string(util::NowMillis()) + ");");
    ++count;
  }
  return count;
}

} // namespace chronicle::db::sql
