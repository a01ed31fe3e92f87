#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "projection_config.hpp"
#include "projection_health.hpp"

namespace chronicle::db::model {
struct EventRecord;
}

namespace chronicle::eventstore {
class EventQueryService;
}

namespace chronicle::projection {

class Projector;
class ProjectionPositionStore;

/*
  Drives one projector through the event log in global_sequence order.

  Delivery is at-least-once: the position is persisted after each applied
  event, so a crash between Apply() and the position write replays that
  event, which the projector absorbs idempotently.

  No internal locking; ProjectionRunner guarantees one caller at a time.
*/
class ProjectionOrchestrator {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  // Throws util::ValidationError when config.batch_size is 0.
  ProjectionOrchestrator(std::shared_ptr<eventstore::EventQueryService> queries, std::shared_ptr<Projector> projector,
                         std::shared_ptr<ProjectionPositionStore> positions, ProjectionConfig config,
                         Sleeper sleeper = {});

  // Applies up to batch_size events. Throws util::ProjectionApplyError when
  // an event exhausts its retries; the position stays before it.
  uint64_t ProcessBatch();

  // Repeats ProcessBatch() until a short batch.
  uint64_t ProcessToCaughtUp();

  // Reset + forget position + catch up from the beginning. Never throws.
  RebuildResult Rebuild();

  ProjectionHealth Health() const;

  ProjectionStatus Status(RunnerState state) const;

  // min(initial * multiplier^(retry-1), max), retry >= 1
  std::chrono::milliseconds RetryDelay(uint32_t retry) const;

  std::string Name() const;

  const ProjectionConfig& Config() const {
    return config_;
  }

 private:
  // applied counts events as they land, so callers see partial progress
  // even when these throw. Each returns the events applied by its batch,
  // CatchUp the running total.
  uint64_t ApplyBatch(uint64_t& applied);
  uint64_t RunBatch(uint64_t& applied); // ApplyBatch under a span, with batch metrics
  uint64_t CatchUp(uint64_t& applied);

  void ApplyWithRetry(const db::model::EventRecord& event);

  std::shared_ptr<eventstore::EventQueryService> queries_;
  std::shared_ptr<Projector>                     projector_;
  std::shared_ptr<ProjectionPositionStore>       positions_;
  ProjectionConfig                               config_;
  Sleeper                                        sleeper_;
};

} // namespace chronicle::projection
