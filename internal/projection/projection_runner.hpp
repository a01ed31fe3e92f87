#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "projection_health.hpp"

namespace chronicle::projection {

class ProjectionOrchestrator;

/*
  Background poller for one projection.

      STOPPED -> STARTING -> RUNNING
                     \-> ERROR        (initial catch-up failed)
      any   -> REBUILDING -> RUNNING | STOPPED

  Each tick runs one ProcessBatch(); the next wait starts only after the
  tick returns, so ticks never overlap. Tick failures are recorded and
  polling carries on.

  Start/Stop/Rebuild are serialized; Status/Health never wait on them.
*/
class ProjectionRunner {
 public:
  ProjectionRunner(std::shared_ptr<ProjectionOrchestrator> orchestrator, std::chrono::milliseconds poll_interval);
  ~ProjectionRunner();

  ProjectionRunner(const ProjectionRunner&)            = delete;
  ProjectionRunner& operator=(const ProjectionRunner&) = delete;

  // Catches up synchronously, then starts polling. Returns whether the
  // runner is running afterwards; a failure is visible through Status().
  bool Start();

  // Waits for an in-flight batch to finish.
  void Stop();

  RebuildResult Rebuild();

  RunnerState State() const {
    return state_.load();
  }

  bool IsRunning() const {
    return State() == RunnerState::kRunning;
  }

  ProjectionStatus Status() const;
  ProjectionHealth Health() const;

  uint64_t ErrorCount() const;

 private:
  bool StartLocked();
  void StopLocked();

  void Run();
  void Tick();
  void RecordError(const std::string& message);

  std::shared_ptr<ProjectionOrchestrator> orchestrator_;
  std::chrono::milliseconds               poll_interval_;

  std::mutex               lifecycle_mutex_;
  std::atomic<RunnerState> state_{RunnerState::kStopped};

  std::thread             thread_;
  std::mutex              wake_mutex_;
  std::condition_variable wake_;
  bool                    stop_requested_ = false;

  mutable std::mutex      error_mutex_;
  std::string             last_error_;
  std::optional<uint64_t> last_error_at_ms_;
  uint64_t                error_count_ = 0;
};

} // namespace chronicle::projection
