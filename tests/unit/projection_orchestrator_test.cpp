#include "internal/projection/projection_orchestrator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/eventstore/event_query_service.hpp"
#include "internal/eventstore/event_store.hpp"
#include "internal/projection/position_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/recording_projector.hpp"

namespace {

using namespace std::chrono_literals;

using chronicle::eventstore::EventStore;
using chronicle::eventstore::NewEvent;
using chronicle::projection::ProjectionConfig;
using chronicle::projection::ProjectionOrchestrator;
using chronicle::projection::RunnerState;
using chronicle::testing::RecordingProjector;

struct Fixture {
  std::shared_ptr<chronicle::db::memory::MemoryRepository>        repo = std::make_shared<chronicle::db::memory::MemoryRepository>();
  std::shared_ptr<EventStore>                                     store = std::make_shared<EventStore>(repo);
  std::shared_ptr<chronicle::eventstore::EventQueryService>       queries =
      std::make_shared<chronicle::eventstore::EventQueryService>(repo);
  std::shared_ptr<chronicle::projection::ProjectionPositionStore> positions =
      std::make_shared<chronicle::projection::ProjectionPositionStore>(repo);
  std::shared_ptr<RecordingProjector>                             projector = std::make_shared<RecordingProjector>("orders");
  std::vector<std::chrono::milliseconds>                          sleeps;

  std::unique_ptr<ProjectionOrchestrator> Make(ProjectionConfig config = {}) {
    config.name = projector->Name();
    return std::make_unique<ProjectionOrchestrator>(queries, projector, positions, config,
                                                    [this](std::chrono::milliseconds d) { sleeps.push_back(d); });
  }

  void Append(const std::string& id, uint64_t expected, int count) {
    std::vector<NewEvent> events;
    for (int i = 0; i < count; ++i) {
      NewEvent e;
      e.event_type = "OrderChanged";
      e.payload    = "{}";
      events.push_back(e);
    }
    store->AppendEvents("Order", id, expected, events);
  }
};

void TestBatchAppliesNewAggregate() {
  Fixture f;
  f.Append("o-1", 0, 3);
  assert(f.store->StreamVersion("Order", "o-1") == 3);

  auto page = f.queries->EventsAfter(std::nullopt, 10);
  assert(page.size() == 3);
  assert(page[0].global_sequence < page[1].global_sequence && page[1].global_sequence < page[2].global_sequence);

  auto orchestrator = f.Make();
  assert(orchestrator->ProcessBatch() == 3);

  auto position = f.positions->Get("orders");
  assert(position.has_value());
  assert(position->events_processed == 3);
  assert(position->last_global_sequence == page[2].global_sequence);
  assert(position->last_event_id == page[2].event_id);

  auto health = orchestrator->Health();
  assert(health.healthy);
  assert(health.lag == 0);
  assert(health.message == "Projection is current");
  assert(health.last_processed_at_ms.has_value());

  // nothing new
  assert(orchestrator->ProcessBatch() == 0);
}

void TestEmptyLog() {
  Fixture f;
  auto    orchestrator = f.Make();
  assert(orchestrator->ProcessBatch() == 0);
  assert(orchestrator->ProcessToCaughtUp() == 0);
  assert(!f.positions->Get("orders").has_value());

  auto health = orchestrator->Health();
  assert(health.lag == 0);
  assert(!health.last_processed_at_ms.has_value());
}

void TestExhaustedRetriesStopAtFailingEvent() {
  Fixture f;
  f.Append("o-1", 0, 3);

  ProjectionConfig config;
  config.max_retries = 2;
  auto orchestrator  = f.Make(config);

  f.projector->FailAt(2, -1);

  bool failed = false;
  try {
    orchestrator->ProcessBatch();
  } catch (const chronicle::util::ProjectionApplyError& e) {
    failed = true;
    assert(e.global_sequence() == 2);
    assert(e.attempts() == 3);
  }
  assert(failed);

  assert(f.projector->Attempts(2) == 3);
  assert(f.sleeps.size() == 2);
  assert(f.sleeps[0] == 100ms);
  assert(f.sleeps[1] == 200ms);

  auto position = f.positions->Get("orders");
  assert(position.has_value());
  assert(position->last_global_sequence == 1u);
  assert(position->events_processed == 1);
  assert(f.projector->Attempts(3) == 0);

  // next poll picks up at event 2 without replaying event 1
  f.projector->FailAt(2, 0);
  assert(orchestrator->ProcessBatch() == 2);
  assert(f.projector->Attempts(1) == 1);
  assert(f.positions->Get("orders")->last_global_sequence == 3u);
  assert(f.projector->Applied() == (std::vector<uint64_t>{1, 2, 3}));
}

void TestTransientFailureRecovers() {
  Fixture f;
  f.Append("o-1", 0, 2);
  auto orchestrator = f.Make();

  f.projector->FailAt(1, 2);
  assert(orchestrator->ProcessBatch() == 2);
  assert(f.projector->Attempts(1) == 3);
  assert(f.sleeps.size() == 2);
  assert(f.positions->Get("orders")->events_processed == 2);
}

void TestRetryDelayIsCapped() {
  Fixture          f;
  ProjectionConfig config;
  config.initial_retry_delay      = 100ms;
  config.retry_backoff_multiplier = 2.0;
  config.max_retry_delay          = 250ms;
  auto orchestrator               = f.Make(config);

  assert(orchestrator->RetryDelay(1) == 100ms);
  assert(orchestrator->RetryDelay(2) == 200ms);
  assert(orchestrator->RetryDelay(3) == 250ms);
  assert(orchestrator->RetryDelay(30) == 250ms);
}

void TestCatchUpAcrossBatches() {
  Fixture f;
  f.Append("o-1", 0, 3);
  f.Append("o-2", 0, 2);

  ProjectionConfig config;
  config.batch_size = 2;
  auto orchestrator = f.Make(config);

  assert(orchestrator->ProcessToCaughtUp() == 5);
  assert(orchestrator->Health().lag == 0);
  assert(f.positions->Get("orders")->events_processed == 5);

  // an exact multiple of the batch size still terminates
  f.Append("o-3", 0, 2);
  assert(orchestrator->ProcessToCaughtUp() == 2);
}

void TestRebuildReproducesLiveState() {
  Fixture f;
  f.Append("o-1", 0, 3);
  f.Append("o-2", 0, 2);

  auto orchestrator = f.Make();
  orchestrator->ProcessToCaughtUp();
  const auto live = f.projector->Applied();

  auto result = orchestrator->Rebuild();
  assert(result.success);
  assert(result.projection_name == "orders");
  assert(result.events_processed == 5);
  assert(result.error_message.empty());
  assert(f.projector->Resets() == 1);
  assert(f.projector->Applied() == live);

  // position was dropped and rebuilt, not added on top
  assert(f.positions->Get("orders")->events_processed == 5);
}

void TestRebuildReportsPartialFailure() {
  Fixture f;
  f.Append("o-1", 0, 5);

  ProjectionConfig config;
  config.max_retries = 0;
  auto orchestrator  = f.Make(config);

  f.projector->FailAt(4, -1);
  auto result = orchestrator->Rebuild();
  assert(!result.success);
  assert(result.events_processed == 3);
  assert(!result.error_message.empty());
  assert(f.sleeps.empty());

  // applied events stay applied
  assert(f.positions->Get("orders")->last_global_sequence == 3u);
  assert(f.projector->Applied().size() == 3);
}

void TestHealthThresholdsAndStatus() {
  Fixture f;
  f.Append("o-1", 0, 5);

  ProjectionConfig config;
  config.lag_warning_threshold = 2;
  config.lag_error_threshold   = 4;
  config.batch_size            = 2;
  auto orchestrator            = f.Make(config);

  auto behind = orchestrator->Health();
  assert(!behind.healthy);
  assert(behind.lag == 5);
  assert(behind.message == "Projection is significantly behind (5 events) - ERROR");

  orchestrator->ProcessBatch();
  auto warning = orchestrator->Health();
  assert(warning.healthy);
  assert(warning.message == "Projection is behind (3 events) - WARNING");

  orchestrator->ProcessBatch();
  assert(orchestrator->Health().message == "Projection is slightly behind (1 events)");

  auto status = orchestrator->Status(RunnerState::kRunning);
  assert(status.projection_name == "orders");
  assert(status.state == RunnerState::kRunning);
  assert(status.events_processed == 4);
  assert(status.event_lag == 1);
  assert(status.last_global_sequence == 4u);
  assert(!status.last_event_id.empty());
}

void TestZeroBatchSizeRejected() {
  Fixture          f;
  ProjectionConfig config;
  config.batch_size = 0;

  bool rejected = false;
  try {
    f.Make(config);
  } catch (const chronicle::util::ValidationError& e) {
    rejected = std::string(e.what()).find("batch_size") != std::string::npos;
  }
  assert(rejected);
}

void TestCatchUpFailureKeepsEarlierBatches() {
  Fixture f;
  f.Append("o-1", 0, 5);

  ProjectionConfig config;
  config.batch_size  = 2;
  config.max_retries = 0;
  auto orchestrator  = f.Make(config);

  // second batch is {3, 4}; 3 lands, 4 fails
  f.projector->FailAt(4, -1);

  bool failed = false;
  try {
    orchestrator->ProcessToCaughtUp();
  } catch (const chronicle::util::ProjectionApplyError& e) {
    failed = true;
    assert(e.global_sequence() == 4);
  }
  assert(failed);
  assert(f.projector->Applied() == (std::vector<uint64_t>{1, 2, 3}));
  assert(f.positions->Get("orders")->last_global_sequence == 3u);

  f.projector->FailAt(4, 0);
  assert(orchestrator->ProcessToCaughtUp() == 2);
  assert(f.positions->Get("orders")->events_processed == 5);
}

} // namespace

int main() {
  TestBatchAppliesNewAggregate();
  TestEmptyLog();
  TestExhaustedRetriesStopAtFailingEvent();
  TestTransientFailureRecovers();
  TestRetryDelayIsCapped();
  TestCatchUpAcrossBatches();
  TestRebuildReproducesLiveState();
  TestRebuildReportsPartialFailure();
  TestHealthThresholdsAndStatus();
  TestZeroBatchSizeRejected();
  TestCatchUpFailureKeepsEarlierBatches();

  std::cout << "chronicle_unit_projection_orchestrator: pass\n";
  return 0;
}
