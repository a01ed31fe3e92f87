#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/event_record.hpp"
#include "internal/db/model/projection_position_record.hpp"

namespace chronicle::db {
class Repository;
}

namespace chronicle::projection {

/*
  Durable per-projection cursor. Each call runs in its own transaction.
  Failures surface as util::StorageError.
*/
class ProjectionPositionStore {
 public:
  explicit ProjectionPositionStore(std::shared_ptr<db::Repository> repository);

  std::optional<db::model::ProjectionPositionRecord> Get(const std::string& projection_name) const;

  // Moves the cursor to event and bumps events_processed.
  void Advance(const std::string& projection_name, const db::model::EventRecord& event);

  void Delete(const std::string& projection_name);

  std::vector<db::model::ProjectionPositionRecord> List() const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace chronicle::projection
