#include "internal/projection/position_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/faulty_repository.hpp"

namespace {

using chronicle::db::model::EventRecord;
using chronicle::projection::ProjectionPositionStore;

EventRecord At(const std::string& id, uint64_t sequence) {
  EventRecord e;
  e.event_id        = id;
  e.global_sequence = sequence;
  return e;
}

void TestAdvanceCountsAndMoves() {
  ProjectionPositionStore positions(std::make_shared<chronicle::db::memory::MemoryRepository>());
  assert(!positions.Get("catalog").has_value());

  positions.Advance("catalog", At("e-1", 1));
  positions.Advance("catalog", At("e-4", 4));

  auto p = positions.Get("catalog");
  assert(p.has_value());
  assert(p->projection_name == "catalog");
  assert(p->last_event_id == "e-4");
  assert(p->last_global_sequence == 4u);
  assert(p->events_processed == 2);
  assert(p->last_processed_at_ms > 0);
}

void TestPositionsAreIndependent() {
  ProjectionPositionStore positions(std::make_shared<chronicle::db::memory::MemoryRepository>());
  positions.Advance("a", At("e-1", 1));
  positions.Advance("b", At("e-2", 2));
  positions.Advance("b", At("e-3", 3));

  auto all = positions.List();
  assert(all.size() == 2);
  assert(positions.Get("a")->events_processed == 1);
  assert(positions.Get("b")->events_processed == 2);

  positions.Delete("b");
  assert(!positions.Get("b").has_value());
  assert(positions.Get("a").has_value());

  // deleting a missing position is fine
  positions.Delete("never-existed");
}

void TestFailuresAreStorageErrors() {
  auto                    repo = std::make_shared<chronicle::testing::FaultyRepository>();
  ProjectionPositionStore positions(repo);
  repo->fail_positions = true;

  bool failed = false;
  try {
    positions.Advance("catalog", At("e-1", 1));
  } catch (const chronicle::util::StorageError&) {
    failed = true;
  }
  assert(failed);

  failed = false;
  try {
    positions.Get("catalog");
  } catch (const chronicle::util::StorageError&) {
    failed = true;
  }
  assert(failed);
}

} // namespace

int main() {
  TestAdvanceCountsAndMoves();
  TestPositionsAreIndependent();
  TestFailuresAreStorageErrors();

  std::cout << "chronicle_unit_position_store: pass\n";
  return 0;
}
