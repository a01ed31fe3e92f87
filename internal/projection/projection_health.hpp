#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "chronicle/v1/admin.pb.h"

namespace chronicle::projection {

enum class RunnerState {
  kStopped,
  kStarting,
  kRunning,
  kRebuilding,
  kError,
};

std::string_view ToString(RunnerState state);

struct ProjectionHealth {
  std::string             projection_name;
  bool                    healthy = true;
  uint64_t                lag     = 0;
  std::optional<uint64_t> last_processed_at_ms;
  std::string             message;

  // runner detail set, filled by ProjectionRunner::Health()
  std::map<std::string, std::string> details;
};

struct ProjectionStatus {
  std::string             projection_name;
  RunnerState             state = RunnerState::kStopped;
  std::string             last_event_id;
  std::optional<uint64_t> last_global_sequence;
  uint64_t                events_processed = 0;
  uint64_t                event_lag        = 0;
  std::optional<uint64_t> last_processed_at_ms;
  std::string             last_error;
  std::optional<uint64_t> last_error_at_ms;
};

struct RebuildResult {
  std::string projection_name;
  uint64_t    events_processed = 0;
  uint64_t    duration_ms      = 0;
  bool        success          = false;
  std::string error_message;
};

/*
  lag == 0               -> current
  lag <  warning         -> slightly behind
  lag <  error           -> behind (WARNING)
  otherwise              -> significantly behind (ERROR), unhealthy
*/
ProjectionHealth EvaluateHealth(std::string projection_name, uint64_t lag, uint64_t lag_warning_threshold,
                                uint64_t lag_error_threshold);

chronicle::v1::RunnerState      ToProto(RunnerState state);
chronicle::v1::ProjectionHealth ToProto(const ProjectionHealth& health);
chronicle::v1::ProjectionStatus ToProto(const ProjectionStatus& status);
chronicle::v1::RebuildResult    ToProto(const RebuildResult& result);

} // namespace chronicle::projection
