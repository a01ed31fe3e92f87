#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace chronicle::db::sqlite {

using chronicle::db::ErrorCode;
using chronicle::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// empty -> NULL
void BindOptText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColU64(st, col);
}

model::StreamRecord ReadStream(sqlite3_stmt* st) {
  model::StreamRecord r;
  r.stream_id      = ColText(st, 0);
  r.aggregate_type = ColText(st, 1);
  r.aggregate_id   = ColText(st, 2);
  r.version        = ColU64(st, 3);
  r.created_at_ms  = ColU64(st, 4);
  r.updated_at_ms  = ColU64(st, 5);
  return r;
}

model::EventRecord ReadEvent(sqlite3_stmt* st) {
  model::EventRecord e;
  e.event_id             = ColText(st, 0);
  e.stream_id            = ColText(st, 1);
  e.aggregate_type       = ColText(st, 2);
  e.aggregate_id         = ColText(st, 3);
  e.event_type           = ColText(st, 4);
  e.event_schema_version = static_cast<uint32_t>(sqlite3_column_int(st, 5));
  e.aggregate_version    = ColU64(st, 6);
  e.payload              = ColText(st, 7);
  e.metadata             = ColText(st, 8);
  e.occurred_at_ms       = ColU64(st, 9);
  e.causation_id         = ColText(st, 10);
  e.correlation_id       = ColText(st, 11);
  e.user_id              = ColText(st, 12);
  e.global_sequence      = ColU64(st, 13);
  return e;
}

model::ProjectionPositionRecord ReadPosition(sqlite3_stmt* st) {
  model::ProjectionPositionRecord p;
  p.projection_name      = ColText(st, 0);
  p.last_event_id        = ColText(st, 1);
  p.last_global_sequence = ColOptU64(st, 2);
  p.events_processed     = ColU64(st, 3);
  p.last_processed_at_ms = ColU64(st, 4);
  return p;
}

model::ProductRecord ReadProduct(sqlite3_stmt* st) {
  model::ProductRecord p;
  p.id                = ColText(st, 0);
  p.sku               = ColText(st, 1);
  p.name              = ColText(st, 2);
  p.description       = ColText(st, 3);
  p.price_cents       = sqlite3_column_int64(st, 4);
  p.price_display     = ColText(st, 5);
  p.status            = ColText(st, 6);
  p.search_text       = ColText(st, 7);
  p.aggregate_version = ColU64(st, 8);
  p.last_event_id     = ColText(st, 9);
  p.created_at_ms     = ColU64(st, 10);
  p.updated_at_ms     = ColU64(st, 11);
  p.deleted           = sqlite3_column_int(st, 12) != 0;
  return p;
}

void BindProductFilter(sqlite3_stmt* st, const model::ProductQuery& q) {
  if (q.status) {
    BindText(st, 1, *q.status);
  } else {
    sqlite3_bind_null(st, 1);
  }
  if (q.min_price_cents) {
    sqlite3_bind_int64(st, 2, *q.min_price_cents);
  } else {
    sqlite3_bind_null(st, 2);
  }
  if (q.max_price_cents) {
    sqlite3_bind_int64(st, 3, *q.max_price_cents);
  } else {
    sqlite3_bind_null(st, 3);
  }
  BindText(st, 4, q.search);
  sqlite3_bind_int(st, 5, q.include_deleted ? 1 : 0);
}

const char* ProductQuerySql(model::ProductSort sort) {
  switch (sort) {
    case model::ProductSort::kPriceAsc: return sql::QUERY_PRODUCTS_BY_PRICE;
    case model::ProductSort::kNewest: return sql::QUERY_PRODUCTS_NEWEST;
    case model::ProductSort::kName: break;
  }
  return sql::QUERY_PRODUCTS_BY_NAME;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED: return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_UNIQUE || rc == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL: return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT: return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default: return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

void SqliteRepository::Throw(sqlite3* db, int rc) {
  auto r = Translate(db, rc);
  throw DbError(r.code, r.message);
}

namespace {

// Reads throw, writes report: both go through these two.
Stmt PrepareOrThrow(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  int           rc = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
  if (rc != SQLITE_OK) {
    sqlite3_finalize(st);
    throw DbError(ErrorCode::InternalError, std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st);
}

template <typename Row, typename Reader>
std::vector<Row> CollectRows(sqlite3* db, sqlite3_stmt* st, Reader read, void (*fail)(sqlite3*, int)) {
  std::vector<Row> out;
  int              rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(read(st));
  }
  if (rc != SQLITE_DONE) fail(db, rc);
  return out;
}

} // namespace

// ------------------------------------------------------------------
// Streams
// ------------------------------------------------------------------

Result SqliteRepository::LockOrCreateStream(Transaction& t, model::StreamRecord& stream) {
  // BEGIN IMMEDIATE already holds the database write lock; that is the
  // stream lock on this backend
  try {
    if (auto existing = GetStream(t, stream.aggregate_type, stream.aggregate_id)) {
      stream = *existing;
      return Result::Ok();
    }
  } catch (const DbError& e) {
    return Result::Err(e.code(), e.what());
  }

  auto* db = TX(t).Handle();
  Stmt  st;
  try {
    st = PrepareOrThrow(db, sql::INSERT_STREAM);
  } catch (const DbError& e) {
    return Result::Err(e.code(), e.what());
  }

  const uint64_t now   = util::NowMillis();
  stream.stream_id     = util::NewUuidString();
  stream.version       = 0;
  stream.created_at_ms = now;
  stream.updated_at_ms = now;

  BindText(st.get(), 1, stream.stream_id);
  BindText(st.get(), 2, stream.aggregate_type);
  BindText(st.get(), 3, stream.aggregate_id);
  BindU64(st.get(), 4, now);
  BindU64(st.get(), 5, now);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::StreamRecord> SqliteRepository::GetStream(Transaction& t, const std::string& aggregate_type,
                                                               const std::string& aggregate_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_STREAM_BY_AGGREGATE);

  BindText(st.get(), 1, aggregate_type);
  BindText(st.get(), 2, aggregate_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) Throw(db, rc);
  return ReadStream(st.get());
}

Result SqliteRepository::UpdateStreamVersion(Transaction& t, const std::string& stream_id, uint64_t version,
                                             uint64_t updated_at_ms) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::UPDATE_STREAM_VERSION, -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Stmt st(raw);

  BindU64(st.get(), 1, version);
  BindU64(st.get(), 2, updated_at_ms);
  BindText(st.get(), 3, stream_id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "stream not found: " + stream_id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteRepository::InsertEvents(Transaction& t, std::vector<model::EventRecord>& events) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::INSERT_EVENT, -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Stmt st(raw);

  for (auto& e : events) {
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());

    BindText(st.get(), 1, e.event_id);
    BindText(st.get(), 2, e.stream_id);
    BindText(st.get(), 3, e.event_type);
    sqlite3_bind_int(st.get(), 4, static_cast<int>(e.event_schema_version));
    BindU64(st.get(), 5, e.aggregate_version);
    BindText(st.get(), 6, e.payload);
    BindText(st.get(), 7, e.metadata);
    BindU64(st.get(), 8, e.occurred_at_ms);
    BindOptText(st.get(), 9, e.causation_id);
    BindOptText(st.get(), 10, e.correlation_id);
    BindOptText(st.get(), 11, e.user_id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    // AUTOINCREMENT under the write lock: commit order == sequence order
    e.global_sequence = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  }

  return Result::Ok();
}

std::vector<model::EventRecord> SqliteRepository::ReadStreamEvents(Transaction& t, const std::string& stream_id,
                                                                   uint64_t after_version) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_STREAM_EVENTS);

  BindText(st.get(), 1, stream_id);
  BindU64(st.get(), 2, after_version);

  return CollectRows<model::EventRecord>(db, st.get(), ReadEvent, &SqliteRepository::Throw);
}

std::vector<model::EventRecord> SqliteRepository::ReadEventsAfter(Transaction& t,
                                                                  std::optional<uint64_t> after_sequence,
                                                                  uint64_t limit) {
  if (limit == 0) return {};

  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_EVENTS_AFTER);

  BindU64(st.get(), 1, after_sequence.value_or(0));
  BindU64(st.get(), 2, limit);

  return CollectRows<model::EventRecord>(db, st.get(), ReadEvent, &SqliteRepository::Throw);
}

std::vector<model::EventRecord> SqliteRepository::FindEventsByCorrelationId(Transaction& t,
                                                                            const std::string& correlation_id) {
  if (correlation_id.empty()) return {};

  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_EVENTS_BY_CORRELATION);

  BindText(st.get(), 1, correlation_id);

  return CollectRows<model::EventRecord>(db, st.get(), ReadEvent, &SqliteRepository::Throw);
}

std::optional<uint64_t> SqliteRepository::GetLatestSequence(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_LATEST_SEQUENCE);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) Throw(db, rc);
  return ColOptU64(st.get(), 0);
}

uint64_t SqliteRepository::CountEventsAfter(Transaction& t, std::optional<uint64_t> after_sequence) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::COUNT_EVENTS_AFTER);

  BindU64(st.get(), 1, after_sequence.value_or(0));

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) Throw(db, rc);
  return ColU64(st.get(), 0);
}

// ------------------------------------------------------------------
// Projection positions
// ------------------------------------------------------------------

std::optional<model::ProjectionPositionRecord> SqliteRepository::GetProjectionPosition(
    Transaction& t, const std::string& projection_name) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_POSITION);

  BindText(st.get(), 1, projection_name);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) Throw(db, rc);
  return ReadPosition(st.get());
}

Result SqliteRepository::AdvanceProjectionPosition(Transaction& t, const std::string& projection_name,
                                                   const std::string& event_id, uint64_t global_sequence,
                                                   uint64_t processed_at_ms) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::ADVANCE_POSITION, -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Stmt st(raw);

  BindText(st.get(), 1, projection_name);
  BindText(st.get(), 2, event_id);
  BindU64(st.get(), 3, global_sequence);
  BindU64(st.get(), 4, processed_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteProjectionPosition(Transaction& t, const std::string& projection_name) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::DELETE_POSITION, -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Stmt st(raw);

  BindText(st.get(), 1, projection_name);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::ProjectionPositionRecord> SqliteRepository::ListProjectionPositions(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_ALL_POSITIONS);

  return CollectRows<model::ProjectionPositionRecord>(db, st.get(), ReadPosition, &SqliteRepository::Throw);
}

// ------------------------------------------------------------------
// Product read model
// ------------------------------------------------------------------

Result SqliteRepository::UpsertProduct(Transaction& t, const model::ProductRecord& product) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::UPSERT_PRODUCT, -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Stmt st(raw);

  BindText(st.get(), 1, product.id);
  BindText(st.get(), 2, product.sku);
  BindText(st.get(), 3, product.name);
  BindText(st.get(), 4, product.description);
  sqlite3_bind_int64(st.get(), 5, product.price_cents);
  BindText(st.get(), 6, product.price_display);
  BindText(st.get(), 7, product.status);
  BindText(st.get(), 8, product.search_text);
  BindU64(st.get(), 9, product.aggregate_version);
  BindOptText(st.get(), 10, product.last_event_id);
  BindU64(st.get(), 11, product.created_at_ms);
  BindU64(st.get(), 12, product.updated_at_ms);
  sqlite3_bind_int(st.get(), 13, product.deleted ? 1 : 0);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ProductRecord> SqliteRepository::GetProduct(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_PRODUCT);

  BindText(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) Throw(db, rc);
  return ReadProduct(st.get());
}

std::optional<model::ProductRecord> SqliteRepository::GetProductBySku(Transaction& t, const std::string& sku) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_PRODUCT_BY_SKU);

  BindText(st.get(), 1, sku);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) Throw(db, rc);
  return ReadProduct(st.get());
}

std::vector<model::ProductRecord> SqliteRepository::QueryProducts(Transaction& t, const model::ProductQuery& query) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, ProductQuerySql(query.sort));

  BindProductFilter(st.get(), query);
  sqlite3_bind_int64(st.get(), 6, query.limit == 0 ? -1 : static_cast<sqlite3_int64>(query.limit));
  BindU64(st.get(), 7, query.offset);

  return CollectRows<model::ProductRecord>(db, st.get(), ReadProduct, &SqliteRepository::Throw);
}

uint64_t SqliteRepository::CountProducts(Transaction& t, const model::ProductQuery& query) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::COUNT_PRODUCTS);

  BindProductFilter(st.get(), query);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) Throw(db, rc);
  return ColU64(st.get(), 0);
}

Result SqliteRepository::DeleteAllProducts(Transaction& t) {
  auto* db = TX(t).Handle();
  try {
    auto st = PrepareOrThrow(db, sql::DELETE_ALL_PRODUCTS);
    return Translate(db, sqlite3_step(st.get()));
  } catch (const DbError& e) {
    return Result::Err(e.code(), e.what());
  }
}

}
