#pragma once

#include <cstdint>
#include <string>

namespace chronicle::db::model {

/*
  Immutable domain event row.

  payload / metadata are stored as JSON text for portability:
    postgres -> jsonb
    sqlite   -> text
    memory   -> string

  global_sequence is 0 until the backend assigns it. Once assigned it is
  the only ordering key projections may use.
*/

struct EventRecord {
  std::string event_id; // UUID
  std::string stream_id;

  // denormalised from the owning stream on read
  std::string aggregate_type;
  std::string aggregate_id;

  std::string event_type;
  uint32_t    event_schema_version = 1;
  uint64_t    aggregate_version    = 0;

  std::string payload;
  std::string metadata;

  uint64_t    occurred_at_ms = 0;
  std::string causation_id;
  std::string correlation_id;
  std::string user_id;

  uint64_t global_sequence = 0;
};

} // namespace chronicle::db::model
