#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace chronicle::db::memory {

/*
  Transaction = row locks + write set
*/

class MemoryTransaction final : public db::Transaction {
 public:
  struct WriteSet {
    std::unordered_map<std::string, model::StreamRecord> streams; // created or updated, by stream_id
    std::vector<model::EventRecord> events;                        // sequences assigned at commit

    // nullopt marks a delete
    std::map<std::string, std::optional<model::ProjectionPositionRecord>> positions;

    // products_cleared drops every committed product before `products` applies
    bool products_cleared = false;
    std::map<std::string, model::ProductRecord> products;
  };

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return finished_;
  }

  // Blocks until no other transaction holds the aggregate.
  void AcquireRowLock(const std::string& aggregate_key);
  bool HoldsRowLock(const std::string& aggregate_key) const;

  WriteSet& Writes() {
    return writes_;
  }
  const WriteSet& Writes() const {
    return writes_;
  }

 private:
  struct HeldLock {
    std::shared_ptr<std::mutex>  mutex;
    std::unique_lock<std::mutex> lock;
  };

  void ThrowIfFinished() const;
  void ReleaseRowLocks();

  MemoryRepository&               repo_;
  WriteSet                        writes_;
  std::map<std::string, HeldLock> row_locks_;
  bool                            finished_ = false;
};

} // namespace chronicle::db::memory
