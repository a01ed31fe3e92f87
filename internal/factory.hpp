#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/projection/projection_config.hpp"

namespace chronicle::db {
class Repository;
}

namespace chronicle::eventstore {
class EventStore;
class EventQueryService;
} // namespace chronicle::eventstore

namespace chronicle::projection {
class ProjectionPositionStore;
class ProjectionOrchestrator;
class ProjectionRunner;
} // namespace chronicle::projection

namespace chronicle::readmodel {
class ProductCatalog;
}

namespace chronicle::factory {

/*
  RuntimeDependencies

  Owns all long-lived objects of one process.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<eventstore::EventStore>        event_store;
  std::shared_ptr<eventstore::EventQueryService> queries;

  std::shared_ptr<projection::ProjectionPositionStore> positions;
  std::shared_ptr<readmodel::ProductCatalog>           catalog;
  std::shared_ptr<projection::ProjectionOrchestrator>  orchestrator;
  std::shared_ptr<projection::ProjectionRunner>        runner;

  projection::ProjectionConfig projection_config;
};

/*
  BuildRuntime

  Composition root: the only place that knows concrete DB types. Opens the
  configured backend, applies schema migrations and wires the product
  projection. The runner is returned stopped.

  Throws util::ValidationError for bad projection settings and
  util::StorageError when the backend cannot be opened or migrated.
*/
RuntimeDependencies BuildRuntime(const chronicle::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const chronicle::runtime::config::RuntimeConfig& config);

} // namespace chronicle::factory
