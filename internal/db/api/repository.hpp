#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/product_record.hpp"
#include "internal/db/model/projection_position_record.hpp"
#include "internal/db/model/stream_record.hpp"

namespace chronicle::db {

/*
  Thrown by read operations when the backend fails.

  Writes report failures through Result instead; reads have nothing
  sensible to return on failure, so they throw.
*/
class DbError : public std::runtime_error {
 public:
  DbError(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode code() const {
    return code_;
  }

 private:
  ErrorCode code_;
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its own writes
  - LockOrCreateStream holds an exclusive lock on the aggregate's stream
    until the transaction ends; appends to one aggregate serialize on it
  - global_sequence is assigned by the backend and follows commit order;
    a sequence value is never handed out twice

  The DB is the source of truth for:
    event streams
    domain events
    projection positions
    the product read model
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Streams
  // ---------------------------------------------------------------------

  // stream.aggregate_type / stream.aggregate_id are inputs. The stream is
  // created at version 0 when missing; every other field is filled in.
  virtual Result LockOrCreateStream(Transaction&, model::StreamRecord& stream) = 0;

  virtual std::optional<model::StreamRecord> GetStream(Transaction&, const std::string& aggregate_type, const std::string& aggregate_id) = 0;

  virtual Result UpdateStreamVersion(Transaction&, const std::string& stream_id, uint64_t version, uint64_t updated_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Events
  // ---------------------------------------------------------------------

  // The stream of every event must be locked by this transaction.
  virtual Result InsertEvents(Transaction&, std::vector<model::EventRecord>& events) = 0;

  virtual std::vector<model::EventRecord> ReadStreamEvents(Transaction&, const std::string& stream_id, uint64_t after_version) = 0;

  // Ascending by global_sequence. after_sequence == nullopt reads from the start.
  virtual std::vector<model::EventRecord> ReadEventsAfter(Transaction&, std::optional<uint64_t> after_sequence, uint64_t limit) = 0;

  virtual std::vector<model::EventRecord> FindEventsByCorrelationId(Transaction&, const std::string& correlation_id) = 0;

  virtual std::optional<uint64_t> GetLatestSequence(Transaction&) = 0;

  virtual uint64_t CountEventsAfter(Transaction&, std::optional<uint64_t> after_sequence) = 0;

  // ---------------------------------------------------------------------
  // Projection positions
  // ---------------------------------------------------------------------

  virtual std::optional<model::ProjectionPositionRecord> GetProjectionPosition(Transaction&, const std::string& projection_name) = 0;

  // Upsert: moves the position to the given event and adds one to events_processed.
  virtual Result AdvanceProjectionPosition(Transaction&, const std::string& projection_name, const std::string& event_id,
                                           uint64_t global_sequence, uint64_t processed_at_ms) = 0;

  virtual Result DeleteProjectionPosition(Transaction&, const std::string& projection_name) = 0;

  virtual std::vector<model::ProjectionPositionRecord> ListProjectionPositions(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Product read model
  // ---------------------------------------------------------------------

  // Insert or replace by id.
  virtual Result UpsertProduct(Transaction&, const model::ProductRecord& product) = 0;

  // Deleted products are returned too.
  virtual std::optional<model::ProductRecord> GetProduct(Transaction&, const std::string& id) = 0;

  // Live products only; when a SKU is shared the lowest id wins.
  virtual std::optional<model::ProductRecord> GetProductBySku(Transaction&, const std::string& sku) = 0;

  virtual std::vector<model::ProductRecord> QueryProducts(Transaction&, const model::ProductQuery& query) = 0;

  // Ignores limit / offset / sort.
  virtual uint64_t CountProducts(Transaction&, const model::ProductQuery& query) = 0;

  virtual Result DeleteAllProducts(Transaction&) = 0;
};

} // namespace chronicle::db
