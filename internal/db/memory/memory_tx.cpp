#include "memory_tx.hpp"

#include <stdexcept>

namespace chronicle::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::AcquireRowLock(const std::string& aggregate_key) {
  ThrowIfFinished();
  if (row_locks_.contains(aggregate_key)) return;

  HeldLock held;
  held.mutex = repo_.RowLock(aggregate_key);
  held.lock  = std::unique_lock<std::mutex>(*held.mutex);
  row_locks_.emplace(aggregate_key, std::move(held));
}

bool MemoryTransaction::HoldsRowLock(const std::string& aggregate_key) const {
  return row_locks_.contains(aggregate_key);
}

void MemoryTransaction::Commit() {
  ThrowIfFinished();
  {
    std::scoped_lock lock(repo_.mutex_);
    auto&            state = repo_.committed_;

    for (const auto& [stream_id, stream] : writes_.streams) {
      state.streams[stream_id] = stream;
      state.aggregate_to_stream[MemoryRepository::AggregateKey(stream.aggregate_type, stream.aggregate_id)] = stream_id;
    }

    for (auto& event : writes_.events) {
      event.global_sequence = ++state.last_sequence;
      state.stream_events[event.stream_id].push_back(state.events.size());
      state.events.push_back(event);
    }

    for (const auto& [name, position] : writes_.positions) {
      if (position.has_value()) {
        state.positions[name] = *position;
      } else {
        state.positions.erase(name);
      }
    }

    if (writes_.products_cleared) state.products.clear();
    for (const auto& [id, product] : writes_.products)
      state.products[id] = product;
  }
  finished_ = true;
  ReleaseRowLocks();
}

void MemoryTransaction::Rollback() {
  writes_   = WriteSet{};
  finished_ = true;
  ReleaseRowLocks();
}

void MemoryTransaction::ThrowIfFinished() const {
  if (finished_) {
    throw std::runtime_error("memory transaction already committed or rolled back");
  }
}

void MemoryTransaction::ReleaseRowLocks() {
  for (auto& [key, held] : row_locks_) {
    held.lock.unlock();
    repo_.ReleaseRowLock(key, held.mutex);
  }
  row_locks_.clear();
}

} // namespace chronicle::db::memory
