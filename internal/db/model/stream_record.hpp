#pragma once

#include <cstdint>
#include <string>

namespace chronicle::db::model {

/*
  One row per aggregate.

  IMPORTANT:
  - (aggregate_type, aggregate_id) is unique.
  - version == number of events appended to the stream.
  - Only the append path mutates this row.
*/

struct StreamRecord {
  std::string stream_id; // UUID, assigned on creation
  std::string aggregate_type;
  std::string aggregate_id;
  uint64_t    version       = 0;
  uint64_t    created_at_ms = 0;
  uint64_t    updated_at_ms = 0;
};

} // namespace chronicle::db::model
