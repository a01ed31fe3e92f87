#include "internal/projection/projection_runner.hpp"

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/eventstore/event_query_service.hpp"
#include "internal/eventstore/event_store.hpp"
#include "internal/projection/position_store.hpp"
#include "internal/projection/projection_orchestrator.hpp"
#include "tests/support/faulty_repository.hpp"
#include "tests/support/recording_projector.hpp"

namespace {

using namespace std::chrono_literals;

using chronicle::eventstore::EventStore;
using chronicle::eventstore::NewEvent;
using chronicle::projection::ProjectionConfig;
using chronicle::projection::ProjectionOrchestrator;
using chronicle::projection::ProjectionRunner;
using chronicle::projection::RunnerState;
using chronicle::testing::FaultyRepository;
using chronicle::testing::RecordingProjector;

struct Fixture {
  std::shared_ptr<FaultyRepository>                               repo  = std::make_shared<FaultyRepository>();
  std::shared_ptr<EventStore>                                     store = std::make_shared<EventStore>(repo);
  std::shared_ptr<chronicle::projection::ProjectionPositionStore> positions =
      std::make_shared<chronicle::projection::ProjectionPositionStore>(repo);
  std::shared_ptr<RecordingProjector>                             projector = std::make_shared<RecordingProjector>("runner");

  std::unique_ptr<ProjectionRunner> Make(uint32_t max_retries = 0) {
    ProjectionConfig config;
    config.name        = projector->Name();
    config.max_retries = max_retries;
    auto orchestrator  = std::make_shared<ProjectionOrchestrator>(std::make_shared<chronicle::eventstore::EventQueryService>(repo),
                                                                  projector, positions, config, [](std::chrono::milliseconds) {});
    return std::make_unique<ProjectionRunner>(orchestrator, 10ms);
  }

  void Append(const std::string& id, uint64_t expected, int count) {
    std::vector<NewEvent> events;
    for (int i = 0; i < count; ++i) {
      NewEvent e;
      e.event_type = "Ticked";
      e.payload    = "{}";
      events.push_back(e);
    }
    store->AppendEvents("Clock", id, expected, events);
  }
};

bool WaitFor(const std::function<bool()>& predicate) {
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return predicate();
}

void TestStartCatchesUpThenPolls() {
  Fixture f;
  f.Append("c-1", 0, 3);

  auto runner = f.Make();
  assert(runner->State() == RunnerState::kStopped);
  assert(runner->Start());
  assert(runner->IsRunning());

  // initial catch-up is synchronous
  assert(f.projector->Applied().size() == 3);

  f.Append("c-1", 3, 2);
  assert(WaitFor([&] { return f.projector->Applied().size() == 5; }));

  // second start is a no-op
  assert(runner->Start());
  assert(runner->IsRunning());

  runner->Stop();
  assert(runner->State() == RunnerState::kStopped);
  runner->Stop();
  assert(runner->State() == RunnerState::kStopped);

  auto status = runner->Status();
  assert(status.events_processed == 5);
  assert(status.event_lag == 0);
  assert(status.last_error.empty());
}

void TestStartFailureSettlesInError() {
  Fixture f;
  f.Append("c-1", 0, 2);
  f.projector->FailAt(2, -1);

  auto runner = f.Make();
  assert(!runner->Start());
  assert(runner->State() == RunnerState::kError);
  assert(!runner->IsRunning());

  auto status = runner->Status();
  assert(status.state == RunnerState::kError);
  assert(!status.last_error.empty());
  assert(status.last_error_at_ms.has_value());
  assert(status.events_processed == 1);

  f.projector->FailAt(2, 0);
  assert(runner->Start());
  assert(runner->IsRunning());
  runner->Stop();
}

void TestTickErrorsAreRecordedAndPollingContinues() {
  Fixture f;
  auto    runner = f.Make();
  assert(runner->Start());

  f.projector->FailAt(1, -1);
  f.Append("c-1", 0, 1);

  assert(WaitFor([&] { return runner->ErrorCount() >= 2; }));
  assert(runner->IsRunning());
  assert(runner->Status().last_error.find("scripted failure") != std::string::npos);

  f.projector->FailAt(1, 0);
  assert(WaitFor([&] { return f.projector->Applied().size() == 1; }));
  runner->Stop();
}

void TestRebuildRestoresPriorState() {
  Fixture f;
  f.Append("c-1", 0, 4);

  auto runner = f.Make();
  assert(runner->Start());

  auto result = runner->Rebuild();
  assert(result.success);
  assert(result.events_processed == 4);
  assert(runner->IsRunning());
  runner->Stop();

  auto again = runner->Rebuild();
  assert(again.success);
  assert(runner->State() == RunnerState::kStopped);
  assert(f.projector->Resets() == 2);

  f.projector->FailAt(3, -1);
  auto failed = runner->Rebuild();
  assert(!failed.success);
  assert(failed.events_processed == 2);
  assert(runner->State() == RunnerState::kStopped);
  assert(!runner->Status().last_error.empty());
}

void TestHealthDetails() {
  Fixture f;
  auto    runner = f.Make();

  auto fresh = runner->Health();
  assert(fresh.healthy);
  assert(fresh.details.at("projectionName") == "runner");
  assert(fresh.details.at("state") == "STOPPED");
  assert(fresh.details.at("running") == "false");
  assert(fresh.details.at("eventLag") == "0");
  assert(fresh.details.at("lagWarningThreshold") == "100");
  assert(fresh.details.at("lagErrorThreshold") == "1000");
  assert(fresh.details.at("lastProcessedAt") == "never");
  assert(fresh.details.at("message") == "Projection is current");

  f.Append("c-1", 0, 1);
  assert(runner->Start());
  auto running = runner->Health();
  assert(running.details.at("state") == "RUNNING");
  assert(running.details.at("running") == "true");
  assert(running.details.at("lastProcessedAt") != "never");
  runner->Stop();
}

void TestHealthAndStatusSurviveStorageFailure() {
  Fixture f;
  auto    runner = f.Make();

  f.repo->fail_reads = true;
  auto health        = runner->Health();
  assert(!health.healthy);
  assert(health.message.find("injected read failure") != std::string::npos);

  f.repo->fail_positions = true;
  auto status            = runner->Status();
  assert(status.projection_name == "runner");
  assert(!status.last_error.empty());
}

void TestDestructorStops() {
  Fixture f;
  {
    auto runner = f.Make();
    assert(runner->Start());
  }
  f.Append("c-1", 0, 1);
  std::this_thread::sleep_for(50ms);
  assert(f.projector->Applied().empty());
}

} // namespace

int main() {
  TestStartCatchesUpThenPolls();
  TestStartFailureSettlesInError();
  TestTickErrorsAreRecordedAndPollingContinues();
  TestRebuildRestoresPriorState();
  TestHealthDetails();
  TestHealthAndStatusSurviveStorageFailure();
  TestDestructorStops();

  std::cout << "chronicle_unit_projection_runner: pass\n";
  return 0;
}
