#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/event_record.hpp"

namespace chronicle::db {
class Repository;
}

namespace chronicle::eventstore {

/*
  One event as supplied by a writer. Versions, ids and sequences are
  assigned by the store.
*/
struct NewEvent {
  std::string event_type;
  uint32_t    event_schema_version = 1;

  std::string payload;  // JSON object
  std::string metadata; // JSON object or empty

  std::string causation_id;
  std::string correlation_id;
  std::string user_id;

  // defaults to now
  std::optional<uint64_t> occurred_at_ms;
};

/*
  Append side of the event log.

  AppendEvents is all-or-nothing: either every event is stored with
  consecutive aggregate versions and fresh global sequences, or nothing is.

  Throws:
    util::ValidationError     malformed input, nothing written
    util::ConcurrencyConflict expected_version != current stream version
    util::StorageError        backend failure, rolled back
*/
class EventStore {
 public:
  explicit EventStore(std::shared_ptr<db::Repository> repository);

  // Returns the stream id.
  std::string AppendEvents(const std::string& aggregate_type, const std::string& aggregate_id,
                           uint64_t expected_version, const std::vector<NewEvent>& events);

  // Events with aggregate_version > from_version, ascending.
  std::vector<db::model::EventRecord> ReadStream(const std::string& aggregate_type, const std::string& aggregate_id,
                                                 uint64_t from_version = 0);

  // 0 when the stream does not exist.
  uint64_t StreamVersion(const std::string& aggregate_type, const std::string& aggregate_id);

  bool StreamExists(const std::string& aggregate_type, const std::string& aggregate_id);

  std::vector<db::model::EventRecord> EventsByCorrelationId(const std::string& correlation_id);

 private:
  void Validate(const std::string& aggregate_type, const std::string& aggregate_id,
                const std::vector<NewEvent>& events) const;

  std::string Append(const std::string& aggregate_type, const std::string& aggregate_id, uint64_t expected_version,
                     const std::vector<NewEvent>& events);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace chronicle::eventstore
