#include "projection_health.hpp"

#include "internal/util/time.hpp"

namespace chronicle::projection {

std::string_view ToString(RunnerState state) {
  switch (state) {
    case RunnerState::kStopped: return "STOPPED";
    case RunnerState::kStarting: return "STARTING";
    case RunnerState::kRunning: return "RUNNING";
    case RunnerState::kRebuilding: return "REBUILDING";
    case RunnerState::kError: return "ERROR";
  }
  return "UNKNOWN";
}

ProjectionHealth EvaluateHealth(std::string projection_name, uint64_t lag, uint64_t lag_warning_threshold,
                                uint64_t lag_error_threshold) {
  ProjectionHealth h;
  h.projection_name = std::move(projection_name);
  h.lag             = lag;
  h.healthy         = lag < lag_error_threshold;

  const auto n = std::to_string(lag);
  if (lag == 0) {
    h.message = "Projection is current";
  } else if (lag < lag_warning_threshold) {
    h.message = "Projection is slightly behind (" + n + " events)";
  } else if (lag < lag_error_threshold) {
    h.message = "Projection is behind (" + n + " events) - WARNING";
  } else {
    h.message = "Projection is significantly behind (" + n + " events) - ERROR";
  }
  return h;
}

chronicle::v1::RunnerState ToProto(RunnerState state) {
  switch (state) {
    case RunnerState::kStopped: return chronicle::v1::RUNNER_STATE_STOPPED;
    case RunnerState::kStarting: return chronicle::v1::RUNNER_STATE_STARTING;
    case RunnerState::kRunning: return chronicle::v1::RUNNER_STATE_RUNNING;
    case RunnerState::kRebuilding: return chronicle::v1::RUNNER_STATE_REBUILDING;
    case RunnerState::kError: return chronicle::v1::RUNNER_STATE_ERROR;
  }
  return chronicle::v1::RUNNER_STATE_UNSPECIFIED;
}

chronicle::v1::ProjectionHealth ToProto(const ProjectionHealth& health) {
  chronicle::v1::ProjectionHealth out;
  out.set_projection_name(health.projection_name);
  out.set_healthy(health.healthy);
  out.set_lag(health.lag);
  if (health.last_processed_at_ms) {
    *out.mutable_last_processed_at() = util::ToProto(util::FromUnixMillis(*health.last_processed_at_ms));
  }
  out.set_message(health.message);
  for (const auto& [k, v] : health.details)
    (*out.mutable_details())[k] = v;
  return out;
}

chronicle::v1::ProjectionStatus ToProto(const ProjectionStatus& status) {
  chronicle::v1::ProjectionStatus out;
  out.set_projection_name(status.projection_name);
  out.set_state(ToProto(status.state));
  out.set_last_event_id(status.last_event_id);
  if (status.last_global_sequence) out.set_last_global_sequence(*status.last_global_sequence);
  out.set_events_processed(status.events_processed);
  out.set_event_lag(status.event_lag);
  if (status.last_processed_at_ms) {
    *out.mutable_last_processed_at() = util::ToProto(util::FromUnixMillis(*status.last_processed_at_ms));
  }
  out.set_last_error(status.last_error);
  if (status.last_error_at_ms) {
    *out.mutable_last_error_at() = util::ToProto(util::FromUnixMillis(*status.last_error_at_ms));
  }
  return out;
}

chronicle::v1::RebuildResult ToProto(const RebuildResult& result) {
  chronicle::v1::RebuildResult out;
  out.set_projection_name(result.projection_name);
  out.set_events_processed(result.events_processed);
  out.set_duration_ms(result.duration_ms);
  out.set_success(result.success);
  out.set_error_message(result.error_message);
  return out;
}

} // namespace chronicle::projection
