#include "projection_runner.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"
#include "projection_orchestrator.hpp"

namespace chronicle::projection {

using chronicle::observability::IntField;
using chronicle::observability::StringField;

ProjectionRunner::ProjectionRunner(std::shared_ptr<ProjectionOrchestrator> orchestrator,
                                   std::chrono::milliseconds poll_interval)
    : orchestrator_(std::move(orchestrator)), poll_interval_(poll_interval) {
}

ProjectionRunner::~ProjectionRunner() {
  Stop();
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

bool ProjectionRunner::Start() {
  std::scoped_lock lock(lifecycle_mutex_);
  return StartLocked();
}

bool ProjectionRunner::StartLocked() {
  const auto name = orchestrator_->Name();

  if (state_ == RunnerState::kRunning) {
    CHRONICLE_LOG_WARN("projection runner already running", {StringField("projection", name)});
    return true;
  }

  state_ = RunnerState::kStarting;
  CHRONICLE_LOG_INFO("projection runner starting", {StringField("projection", name)});

  try {
    const auto applied = orchestrator_->ProcessToCaughtUp();
    CHRONICLE_LOG_INFO("projection caught up", {StringField("projection", name), IntField("events", static_cast<int64_t>(applied))});
  } catch (const std::exception& e) {
    RecordError(e.what());
    state_ = RunnerState::kError;
    CHRONICLE_LOG_ERROR("projection runner failed to start", {StringField("projection", name), StringField("error", e.what())});
    return false;
  }

  {
    std::scoped_lock wake_lock(wake_mutex_);
    stop_requested_ = false;
  }
  state_  = RunnerState::kRunning;
  thread_ = std::thread(&ProjectionRunner::Run, this);

  CHRONICLE_LOG_INFO("projection runner running", {StringField("projection", name),
                                                   IntField("poll_interval_ms", poll_interval_.count())});
  return true;
}

void ProjectionRunner::Stop() {
  std::scoped_lock lock(lifecycle_mutex_);
  StopLocked();
}

void ProjectionRunner::StopLocked() {
  if (state_ == RunnerState::kStopped) return;

  {
    std::scoped_lock wake_lock(wake_mutex_);
    stop_requested_ = true;
  }
  wake_.notify_all();

  if (thread_.joinable()) thread_.join();

  state_ = RunnerState::kStopped;
  CHRONICLE_LOG_INFO("projection runner stopped", {StringField("projection", orchestrator_->Name())});
}

RebuildResult ProjectionRunner::Rebuild() {
  std::scoped_lock lock(lifecycle_mutex_);

  const bool was_running = state_ == RunnerState::kRunning;
  if (was_running) StopLocked();

  state_      = RunnerState::kRebuilding;
  auto result = orchestrator_->Rebuild();
  state_      = RunnerState::kStopped;

  if (!result.success) {
    RecordError(result.error_message);
  } else if (was_running) {
    StartLocked();
  }
  return result;
}

// ------------------------------------------------------------
// Poll loop
// ------------------------------------------------------------

void ProjectionRunner::Run() {
  std::unique_lock lock(wake_mutex_);
  while (!stop_requested_) {
    if (wake_.wait_for(lock, poll_interval_, [this] { return stop_requested_; })) break;

    lock.unlock();
    Tick();
    lock.lock();
  }
}

void ProjectionRunner::Tick() {
  try {
    orchestrator_->ProcessBatch();
  } catch (const std::exception& e) {
    RecordError(e.what());
    CHRONICLE_LOG_ERROR("projection poll failed", {StringField("projection", orchestrator_->Name()), StringField("error", e.what())});
  }
}

void ProjectionRunner::RecordError(const std::string& message) {
  std::scoped_lock lock(error_mutex_);
  last_error_       = message;
  last_error_at_ms_ = util::NowMillis();
  ++error_count_;
}

uint64_t ProjectionRunner::ErrorCount() const {
  std::scoped_lock lock(error_mutex_);
  return error_count_;
}

// ------------------------------------------------------------
// Status / health
// ------------------------------------------------------------

ProjectionStatus ProjectionRunner::Status() const {
  ProjectionStatus status;
  try {
    status = orchestrator_->Status(State());
  } catch (const std::exception& e) {
    // position store unreachable: report what the runner knows
    status.projection_name = orchestrator_->Name();
    status.state           = State();
    std::scoped_lock lock(error_mutex_);
    status.last_error       = e.what();
    status.last_error_at_ms = util::NowMillis();
    return status;
  }

  std::scoped_lock lock(error_mutex_);
  status.last_error       = last_error_;
  status.last_error_at_ms = last_error_at_ms_;
  return status;
}

ProjectionHealth ProjectionRunner::Health() const {
  const auto& config = orchestrator_->Config();
  const auto  state  = State();

  ProjectionHealth health;
  try {
    health = orchestrator_->Health();
  } catch (const std::exception& e) {
    health.projection_name = orchestrator_->Name();
    health.healthy         = false;
    health.message         = std::string("Health check failed: ") + e.what();
    health.details["error"] = e.what();
  }

  health.details["projectionName"]      = health.projection_name;
  health.details["state"]               = std::string(ToString(state));
  health.details["running"]             = state == RunnerState::kRunning ? "true" : "false";
  health.details["eventLag"]            = std::to_string(health.lag);
  health.details["lagWarningThreshold"] = std::to_string(config.lag_warning_threshold);
  health.details["lagErrorThreshold"]   = std::to_string(config.lag_error_threshold);
  health.details["lastProcessedAt"] =
      health.last_processed_at_ms ? util::FormatUnixMillis(*health.last_processed_at_ms) : "never";
  health.details["message"] = health.message;
  return health;
}

} // namespace chronicle::projection
