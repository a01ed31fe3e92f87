#include "event_store.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <chrono>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace chronicle::eventstore {

namespace {

using chronicle::observability::IntField;
using chronicle::observability::StringField;

bool IsJsonObject(const std::string& text) {
  google::protobuf::Struct as_struct;
  return google::protobuf::util::JsonStringToMessage(text, &as_struct).ok();
}

[[noreturn]] void ThrowStorage(const db::Result& result, const std::string& prefix) {
  throw util::StorageError(result.code, prefix + ": " + result.message);
}

void ThrowIfError(const db::Result& result, const std::string& prefix) {
  if (!result) {
    ThrowStorage(result, prefix);
  }
}

template <typename Fn>
auto WrapReads(const std::string& op, Fn&& fn) {
  try {
    return fn();
  } catch (const db::DbError& e) {
    throw util::StorageError(e.code(), op + ": " + e.what());
  }
}

} // namespace

EventStore::EventStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void EventStore::Validate(const std::string& aggregate_type, const std::string& aggregate_id,
                          const std::vector<NewEvent>& events) const {
  if (aggregate_type.empty()) throw util::ValidationError("aggregate type must not be empty");
  if (aggregate_id.empty()) throw util::ValidationError("aggregate id must not be empty");
  if (events.empty()) throw util::ValidationError("at least one event is required");

  for (std::size_t i = 0; i < events.size(); ++i) {
    const auto& e   = events[i];
    const auto  pos = "event[" + std::to_string(i) + "]: ";

    if (e.event_type.empty()) throw util::ValidationError(pos + "event type must not be empty");
    if (e.event_schema_version < 1) throw util::ValidationError(pos + "event schema version must be >= 1");
    if (!IsJsonObject(e.payload)) throw util::ValidationError(pos + "payload must be a JSON object");
    if (!e.metadata.empty() && !IsJsonObject(e.metadata)) {
      throw util::ValidationError(pos + "metadata must be empty or a JSON object");
    }
  }
}

std::string EventStore::AppendEvents(const std::string& aggregate_type, const std::string& aggregate_id,
                                     uint64_t expected_version, const std::vector<NewEvent>& events) {
  observability::SpanScope span("EventStore.AppendEvents");
  span.SetAttribute("aggregate.type", aggregate_type);
  span.SetAttribute("aggregate.id", aggregate_id);
  span.SetAttribute("events.count", static_cast<std::int64_t>(events.size()));

  auto&      metrics    = observability::Metrics::Instance();
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    Validate(aggregate_type, aggregate_id, events);
    auto stream_id = Append(aggregate_type, aggregate_id, expected_version, events);

    metrics.RecordAppend(aggregate_type, true);
    metrics.ObserveAppendLatencyMs(aggregate_type, elapsed_ms());
    return stream_id;
  } catch (const util::ConcurrencyConflict& e) {
    span.RecordException(e.what());
    CHRONICLE_LOG_WARN("append conflict", {StringField("aggregate_type", aggregate_type), StringField("aggregate_id", aggregate_id),
                                           IntField("expected", static_cast<int64_t>(e.expected())),
                                           IntField("actual", static_cast<int64_t>(e.actual()))});
    metrics.RecordAppend(aggregate_type, false);
    throw;
  } catch (const util::StorageError& e) {
    span.RecordException(e.what());
    CHRONICLE_LOG_ERROR("append failed", {StringField("aggregate_type", aggregate_type), StringField("aggregate_id", aggregate_id),
                                          StringField("error", e.what())});
    metrics.RecordAppend(aggregate_type, false);
    throw;
  } catch (const util::ValidationError& e) {
    span.RecordException(e.what());
    metrics.RecordAppend(aggregate_type, false);
    throw;
  }
}

std::string EventStore::Append(const std::string& aggregate_type, const std::string& aggregate_id,
                               uint64_t expected_version, const std::vector<NewEvent>& events) {
  std::unique_ptr<db::Transaction> tx;
  try {
    tx = repository_->Begin();
  } catch (const db::DbError& e) {
    throw util::StorageError(e.code(), std::string("append: begin: ") + e.what());
  } catch (const std::runtime_error& e) {
    throw util::StorageError(db::ErrorCode::IOError, std::string("append: begin: ") + e.what());
  }

  db::model::StreamRecord stream;
  stream.aggregate_type = aggregate_type;
  stream.aggregate_id   = aggregate_id;

  auto locked = repository_->LockOrCreateStream(*tx, stream);
  if (!locked) {
    // lost the race to create the same new stream
    if (locked.code == db::ErrorCode::AlreadyExists) {
      tx.reset();
      throw util::ConcurrencyConflict(expected_version, StreamVersion(aggregate_type, aggregate_id));
    }
    ThrowStorage(locked, "append: lock stream");
  }

  if (stream.version != expected_version) {
    throw util::ConcurrencyConflict(expected_version, stream.version);
  }

  const uint64_t now = util::NowMillis();

  std::vector<db::model::EventRecord> records;
  records.reserve(events.size());

  uint64_t version = stream.version;
  for (const auto& e : events) {
    db::model::EventRecord r;
    r.event_id             = util::NewUuidString();
    r.stream_id            = stream.stream_id;
    r.aggregate_type       = aggregate_type;
    r.aggregate_id         = aggregate_id;
    r.event_type           = e.event_type;
    r.event_schema_version = e.event_schema_version;
    r.aggregate_version    = ++version;
    r.payload              = e.payload;
    r.metadata             = e.metadata;
    r.occurred_at_ms       = e.occurred_at_ms.value_or(now);
    r.causation_id         = e.causation_id;
    r.correlation_id       = e.correlation_id;
    r.user_id              = e.user_id;
    records.push_back(std::move(r));
  }

  ThrowIfError(repository_->InsertEvents(*tx, records), "append: insert events");
  ThrowIfError(repository_->UpdateStreamVersion(*tx, stream.stream_id, version, now), "append: update stream version");

  try {
    tx->Commit();
  } catch (const db::DbError& e) {
    throw util::StorageError(e.code(), std::string("append: commit: ") + e.what());
  } catch (const std::runtime_error& e) {
    throw util::StorageError(db::ErrorCode::InternalError, std::string("append: commit: ") + e.what());
  }

  CHRONICLE_LOG_DEBUG("events appended", {StringField("aggregate_type", aggregate_type), StringField("aggregate_id", aggregate_id),
                                          StringField("stream_id", stream.stream_id),
                                          IntField("version", static_cast<int64_t>(version)),
                                          IntField("count", static_cast<int64_t>(records.size()))});
  return stream.stream_id;
}

std::vector<db::model::EventRecord> EventStore::ReadStream(const std::string& aggregate_type,
                                                           const std::string& aggregate_id, uint64_t from_version) {
  return WrapReads("read stream", [&] {
    auto tx     = repository_->Begin();
    auto stream = repository_->GetStream(*tx, aggregate_type, aggregate_id);
    if (!stream) return std::vector<db::model::EventRecord>{};

    auto events = repository_->ReadStreamEvents(*tx, stream->stream_id, from_version);
    tx->Commit();
    return events;
  });
}

uint64_t EventStore::StreamVersion(const std::string& aggregate_type, const std::string& aggregate_id) {
  return WrapReads("stream version", [&] {
    auto tx     = repository_->Begin();
    auto stream = repository_->GetStream(*tx, aggregate_type, aggregate_id);
    tx->Commit();
    return stream ? stream->version : uint64_t{0};
  });
}

bool EventStore::StreamExists(const std::string& aggregate_type, const std::string& aggregate_id) {
  return WrapReads("stream exists", [&] {
    auto tx     = repository_->Begin();
    auto stream = repository_->GetStream(*tx, aggregate_type, aggregate_id);
    tx->Commit();
    return stream.has_value();
  });
}

std::vector<db::model::EventRecord> EventStore::EventsByCorrelationId(const std::string& correlation_id) {
  return WrapReads("events by correlation id", [&] {
    auto tx     = repository_->Begin();
    auto events = repository_->FindEventsByCorrelationId(*tx, correlation_id);
    tx->Commit();
    return events;
  });
}

} // namespace chronicle::eventstore
