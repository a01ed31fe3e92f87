#include "internal/projection/projection_health.hpp"

#include <cassert>
#include <iostream>

namespace {

using chronicle::projection::EvaluateHealth;
using chronicle::projection::RunnerState;

void TestHealthBands() {
  auto current = EvaluateHealth("p", 0, 100, 1000);
  assert(current.healthy);
  assert(current.message == "Projection is current");

  auto slight = EvaluateHealth("p", 99, 100, 1000);
  assert(slight.healthy);
  assert(slight.message == "Projection is slightly behind (99 events)");

  auto warning = EvaluateHealth("p", 100, 100, 1000);
  assert(warning.healthy);
  assert(warning.message == "Projection is behind (100 events) - WARNING");

  auto error = EvaluateHealth("p", 1000, 100, 1000);
  assert(!error.healthy);
  assert(error.lag == 1000);
  assert(error.message == "Projection is significantly behind (1000 events) - ERROR");
}

void TestStateNames() {
  assert(ToString(RunnerState::kStopped) == "STOPPED");
  assert(ToString(RunnerState::kStarting) == "STARTING");
  assert(ToString(RunnerState::kRunning) == "RUNNING");
  assert(ToString(RunnerState::kRebuilding) == "REBUILDING");
  assert(ToString(RunnerState::kError) == "ERROR");
}

void TestProtoMapping() {
  chronicle::projection::ProjectionStatus status;
  status.projection_name      = "p";
  status.state                = RunnerState::kRunning;
  status.last_global_sequence = 7;
  status.events_processed     = 7;
  status.event_lag            = 2;
  status.last_processed_at_ms = 1700000000000;

  auto proto = chronicle::projection::ToProto(status);
  assert(proto.state() == chronicle::v1::RUNNER_STATE_RUNNING);
  assert(proto.has_last_global_sequence());
  assert(proto.last_global_sequence() == 7);
  assert(proto.last_processed_at().seconds() == 1700000000);
  assert(!proto.has_last_error_at());

  chronicle::projection::ProjectionStatus fresh;
  fresh.projection_name = "q";
  assert(!chronicle::projection::ToProto(fresh).has_last_global_sequence());

  auto health = EvaluateHealth("p", 3, 100, 1000);
  health.details["state"] = "RUNNING";
  auto health_proto       = chronicle::projection::ToProto(health);
  assert(health_proto.healthy());
  assert(health_proto.details().at("state") == "RUNNING");
  assert(!health_proto.has_last_processed_at());
}

} // namespace

int main() {
  TestHealthBands();
  TestStateNames();
  TestProtoMapping();

  std::cout << "chronicle_unit_projection_health: pass\n";
  return 0;
}
