#pragma once

#include <string>

#include "internal/db/model/event_record.hpp"
#include "internal/db/model/projection_position_record.hpp"

namespace chronicle::projection {

/*
  A read model fed from the event log.

  Apply() must be idempotent: an event the read model has already absorbed
  (by aggregate version or global sequence) is a successful no-op. It throws
  on failure; the orchestrator retries the same event.
*/
class Projector {
 public:
  virtual ~Projector() = default;

  // Key of the projection's position row. [A-Za-z0-9_-]+
  virtual std::string Name() const = 0;

  virtual void Apply(const db::model::EventRecord& event) = 0;

  // Drop all read model state ahead of a rebuild.
  virtual void Reset() = 0;

  // Default-constructed when the projection has never applied anything.
  virtual db::model::ProjectionPositionRecord CurrentPosition() const = 0;
};

} // namespace chronicle::projection
