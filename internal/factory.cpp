#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/eventstore/event_query_service.hpp"
#include "internal/eventstore/event_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/projection/position_store.hpp"
#include "internal/projection/projection_orchestrator.hpp"
#include "internal/projection/projection_runner.hpp"
#include "internal/readmodel/product_catalog.hpp"
#include "internal/readmodel/product_projector.hpp"
#include "internal/util/errors.hpp"
#if CHRONICLE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if CHRONICLE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace chronicle::factory {

using chronicle::observability::IntField;
using chronicle::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const chronicle::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();

  try {
    if (database.has_sqlite()) {
#if CHRONICLE_DB_SQLITE
      auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
      const int applied = sqlite_db->Migrate();
      CHRONICLE_LOG_INFO("sqlite event store ready", {StringField("path", database.sqlite().path()), IntField("migrations_applied", applied)});
      return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
      throw util::StorageError(db::ErrorCode::Unsupported, "sqlite backend requested but not enabled at build time");
#endif
    }

    if (database.has_postgres()) {
#if CHRONICLE_DB_POSTGRES
      const auto& pg          = database.postgres();
      const auto  connections = pg.max_connections() > 0 ? pg.max_connections() : 16u;

      auto pool       = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), connections);
      auto repository = std::make_shared<db::postgres::PgRepository>(pool);
      const int applied = repository->Migrate();
      CHRONICLE_LOG_INFO("postgres event store ready", {IntField("migrations_applied", applied), IntField("max_connections", connections)});
      return repository;
#else
      throw util::StorageError(db::ErrorCode::Unsupported, "postgres backend requested but not enabled at build time");
#endif
    }
  } catch (const db::DbError& e) {
    throw util::StorageError(e.code(), std::string("opening event store: ") + e.what());
  }

  CHRONICLE_LOG_INFO("memory event store ready");
  return std::make_shared<db::memory::MemoryRepository>();
}

RuntimeDependencies BuildRuntime(const chronicle::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;
  deps.projection_config = config::ConfigLoader::ProjectionSettings(config);

  // ------------------------------------------------------------------
  // Event store
  // ------------------------------------------------------------------
  deps.repository  = BuildRepository(config);
  deps.event_store = std::make_shared<eventstore::EventStore>(deps.repository);
  deps.queries     = std::make_shared<eventstore::EventQueryService>(deps.repository);

  // ------------------------------------------------------------------
  // Product projection
  // ------------------------------------------------------------------
  deps.positions = std::make_shared<projection::ProjectionPositionStore>(deps.repository);
  deps.catalog   = std::make_shared<readmodel::ProductCatalog>(deps.repository);

  auto projector = std::make_shared<readmodel::ProductProjector>(deps.catalog, deps.positions, deps.projection_config.name);

  deps.orchestrator = std::make_shared<projection::ProjectionOrchestrator>(deps.queries, projector, deps.positions, deps.projection_config);
  deps.runner       = std::make_shared<projection::ProjectionRunner>(deps.orchestrator, deps.projection_config.poll_interval);

  return deps;
}

} // namespace chronicle::factory
