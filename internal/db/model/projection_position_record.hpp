#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace chronicle::db::model {

struct ProjectionPositionRecord {
  std::string             projection_name;
  std::string             last_event_id;
  std::optional<uint64_t> last_global_sequence;
  uint64_t                events_processed     = 0;
  uint64_t                last_processed_at_ms = 0;
};

} // namespace chronicle::db::model
