#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/model/event_record.hpp"

namespace chronicle::db {
class Repository;
}

namespace chronicle::eventstore {

/*
  Read side of the event log in global order.

  global_sequence is the only ordering key; a cursor is the last sequence
  the caller has seen (nullopt = from the beginning).
*/
class EventQueryService {
 public:
  explicit EventQueryService(std::shared_ptr<db::Repository> repository);

  // Ascending, at most limit events. Empty means caught up.
  std::vector<db::model::EventRecord> EventsAfter(std::optional<uint64_t> cursor, uint64_t limit) const;

  std::optional<uint64_t> LatestSequence() const;

  // Lag reporting only.
  uint64_t CountAfter(std::optional<uint64_t> cursor) const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace chronicle::eventstore
