#include "projection_orchestrator.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

#include "internal/db/model/event_record.hpp"
#include "internal/eventstore/event_query_service.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "position_store.hpp"
#include "projector.hpp"

namespace chronicle::projection {

using chronicle::observability::IntField;
using chronicle::observability::StringField;

ProjectionOrchestrator::ProjectionOrchestrator(std::shared_ptr<eventstore::EventQueryService> queries,
                                               std::shared_ptr<Projector> projector,
                                               std::shared_ptr<ProjectionPositionStore> positions,
                                               ProjectionConfig config, Sleeper sleeper)
    : queries_(std::move(queries)),
      projector_(std::move(projector)),
      positions_(std::move(positions)),
      config_(std::move(config)),
      sleeper_(std::move(sleeper)) {
  if (config_.batch_size == 0) {
    throw util::ValidationError("projection " + projector_->Name() + ": batch_size must be at least 1");
  }
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

std::string ProjectionOrchestrator::Name() const {
  return projector_->Name();
}

std::chrono::milliseconds ProjectionOrchestrator::RetryDelay(uint32_t retry) const {
  const double initial = static_cast<double>(config_.initial_retry_delay.count());
  const double cap     = static_cast<double>(config_.max_retry_delay.count());
  const double delay   = initial * std::pow(config_.retry_backoff_multiplier, retry == 0 ? 0 : retry - 1);
  return std::chrono::milliseconds(static_cast<int64_t>(std::min(delay, cap)));
}

// ------------------------------------------------------------
// Batch processing
// ------------------------------------------------------------

void ProjectionOrchestrator::ApplyWithRetry(const db::model::EventRecord& event) {
  for (uint32_t attempt = 1;; ++attempt) {
    try {
      projector_->Apply(event);
      return;
    } catch (const std::exception& e) {
      if (attempt > config_.max_retries) {
        CHRONICLE_LOG_ERROR("projection retries exhausted",
                            {StringField("projection", Name()), StringField("event_id", event.event_id),
                             IntField("global_sequence", static_cast<int64_t>(event.global_sequence)),
                             IntField("attempts", attempt), StringField("error", e.what())});
        throw util::ProjectionApplyError(event.event_id, event.global_sequence, attempt, e.what());
      }

      const auto delay = RetryDelay(attempt);
      CHRONICLE_LOG_WARN("projection apply failed, retrying",
                         {StringField("projection", Name()), StringField("event_id", event.event_id),
                          IntField("attempt", attempt), IntField("delay_ms", delay.count()), StringField("error", e.what())});
      sleeper_(delay);
    }
  }
}

uint64_t ProjectionOrchestrator::ApplyBatch(uint64_t& applied) {
  const auto name     = Name();
  const auto position = positions_->Get(name);
  const auto cursor   = position ? position->last_global_sequence : std::nullopt;

  const auto events = queries_->EventsAfter(cursor, config_.batch_size);

  uint64_t in_batch = 0;
  for (const auto& event : events) {
    ApplyWithRetry(event);
    positions_->Advance(name, event);
    ++in_batch;
    ++applied;
  }
  return in_batch;
}

uint64_t ProjectionOrchestrator::RunBatch(uint64_t& applied) {
  observability::SpanScope span("ProjectionOrchestrator.ProcessBatch");
  const auto               name = Name();
  span.SetAttribute("projection.name", name);

  auto&          metrics    = observability::Metrics::Instance();
  const auto     started_at = std::chrono::steady_clock::now();
  const uint64_t before     = applied;
  uint64_t       in_batch   = 0;

  try {
    in_batch = ApplyBatch(applied);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    metrics.AddEventsProcessed(name, applied - before);
    metrics.RecordProjectionError(name);
    throw;
  }

  span.SetAttribute("events.applied", static_cast<std::int64_t>(in_batch));
  metrics.AddEventsProcessed(name, in_batch);
  metrics.ObserveBatchDurationMs(name, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());

  if (in_batch > 0) {
    CHRONICLE_LOG_DEBUG("projection batch applied", {StringField("projection", name), IntField("events", static_cast<int64_t>(in_batch))});
  }
  return in_batch;
}

uint64_t ProjectionOrchestrator::ProcessBatch() {
  uint64_t applied = 0;
  return RunBatch(applied);
}

uint64_t ProjectionOrchestrator::CatchUp(uint64_t& applied) {
  for (;;) {
    if (RunBatch(applied) < config_.batch_size) return applied;
  }
}

uint64_t ProjectionOrchestrator::ProcessToCaughtUp() {
  uint64_t applied = 0;
  return CatchUp(applied);
}

// ------------------------------------------------------------
// Rebuild
// ------------------------------------------------------------

RebuildResult ProjectionOrchestrator::Rebuild() {
  observability::SpanScope span("ProjectionOrchestrator.Rebuild");

  RebuildResult result;
  result.projection_name = Name();
  span.SetAttribute("projection.name", result.projection_name);

  CHRONICLE_LOG_INFO("projection rebuild started", {StringField("projection", result.projection_name)});
  const auto started_at = std::chrono::steady_clock::now();

  uint64_t applied = 0;
  try {
    projector_->Reset();
    positions_->Delete(result.projection_name);
    CatchUp(applied);
    result.success = true;
  } catch (const std::exception& e) {
    result.success       = false;
    result.error_message = e.what();
    span.RecordException(e.what());
  }

  result.events_processed = applied;
  result.duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count();

  if (result.success) {
    CHRONICLE_LOG_INFO("projection rebuild finished", {StringField("projection", result.projection_name),
                                                       IntField("events", static_cast<int64_t>(applied)),
                                                       IntField("duration_ms", static_cast<int64_t>(result.duration_ms))});
  } else {
    CHRONICLE_LOG_ERROR("projection rebuild failed", {StringField("projection", result.projection_name),
                                                      IntField("events", static_cast<int64_t>(applied)),
                                                      StringField("error", result.error_message)});
  }
  return result;
}

// ------------------------------------------------------------
// Health / status
// ------------------------------------------------------------

ProjectionHealth ProjectionOrchestrator::Health() const {
  const auto name     = Name();
  const auto position = positions_->Get(name);
  const auto cursor   = position ? position->last_global_sequence : std::nullopt;
  const auto lag      = queries_->CountAfter(cursor);

  observability::Metrics::Instance().SetProjectionLag(name, lag);

  auto health = EvaluateHealth(name, lag, config_.lag_warning_threshold, config_.lag_error_threshold);
  if (position) health.last_processed_at_ms = position->last_processed_at_ms;
  return health;
}

ProjectionStatus ProjectionOrchestrator::Status(RunnerState state) const {
  ProjectionStatus status;
  status.projection_name = Name();
  status.state           = state;

  const auto position = positions_->Get(status.projection_name);
  if (position) {
    status.last_event_id        = position->last_event_id;
    status.last_global_sequence = position->last_global_sequence;
    status.events_processed     = position->events_processed;
    status.last_processed_at_ms = position->last_processed_at_ms;
  }
  status.event_lag = queries_->CountAfter(status.last_global_sequence);

  observability::Metrics::Instance().SetProjectionLag(status.projection_name, status.event_lag);
  return status;
}

} // namespace chronicle::projection
