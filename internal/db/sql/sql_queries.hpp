#pragma once

namespace chronicle::db::sql {

/*
  Canonical SQL used by the SQLite backend.

  PostgreSQL keeps its own $n flavoured copies as prepared statements
  (see PgPool::PrepareStatements); column order matches these.
*/

// streams

static constexpr const char* SELECT_STREAM_BY_AGGREGATE =
    "SELECT stream_id,aggregate_type,aggregate_id,version,created_at_ms,updated_at_ms"
    " FROM event_stream WHERE aggregate_type=? AND aggregate_id=?;";

static constexpr const char* INSERT_STREAM =
    "INSERT INTO event_stream(stream_id,aggregate_type,aggregate_id,version,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,0,?,?);";

static constexpr const char* UPDATE_STREAM_VERSION =
    "UPDATE event_stream SET version=?,updated_at_ms=? WHERE stream_id=?;";

// events

#define CHRONICLE_EVENT_COLUMNS                                                                             \
  "e.event_id,e.stream_id,s.aggregate_type,s.aggregate_id,e.event_type,e.event_schema_version,"               \
  "e.aggregate_version,e.payload,e.metadata,e.occurred_at_ms,COALESCE(e.causation_id,''),"                    \
  "COALESCE(e.correlation_id,''),COALESCE(e.user_id,''),e.global_sequence"

static constexpr const char* INSERT_EVENT =
    "INSERT INTO domain_event(event_id,stream_id,event_type,event_schema_version,aggregate_version,"
    "payload,metadata,occurred_at_ms,causation_id,correlation_id,user_id)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_STREAM_EVENTS =
    "SELECT " CHRONICLE_EVENT_COLUMNS
    " FROM domain_event e JOIN event_stream s ON s.stream_id=e.stream_id"
    " WHERE e.stream_id=? AND e.aggregate_version>? ORDER BY e.aggregate_version ASC;";

static constexpr const char* SELECT_EVENTS_AFTER =
    "SELECT " CHRONICLE_EVENT_COLUMNS
    " FROM domain_event e JOIN event_stream s ON s.stream_id=e.stream_id"
    " WHERE e.global_sequence>? ORDER BY e.global_sequence ASC LIMIT ?;";

static constexpr const char* SELECT_EVENTS_BY_CORRELATION =
    "SELECT " CHRONICLE_EVENT_COLUMNS
    " FROM domain_event e JOIN event_stream s ON s.stream_id=e.stream_id"
    " WHERE e.correlation_id=? ORDER BY e.global_sequence ASC;";

#undef CHRONICLE_EVENT_COLUMNS

static constexpr const char* SELECT_LATEST_SEQUENCE =
    "SELECT MAX(global_sequence) FROM domain_event;";

static constexpr const char* COUNT_EVENTS_AFTER =
    "SELECT COUNT(*) FROM domain_event WHERE global_sequence>?;";

// projection positions

static constexpr const char* SELECT_POSITION =
    "SELECT projection_name,COALESCE(last_event_id,''),last_global_sequence,events_processed,last_processed_at_ms"
    " FROM projection_position WHERE projection_name=?;";

static constexpr const char* SELECT_ALL_POSITIONS =
    "SELECT projection_name,COALESCE(last_event_id,''),last_global_sequence,events_processed,last_processed_at_ms"
    " FROM projection_position ORDER BY projection_name ASC;";

static constexpr const char* ADVANCE_POSITION =
    "INSERT INTO projection_position(projection_name,last_event_id,last_global_sequence,events_processed,last_processed_at_ms)"
    " VALUES(?,?,?,1,?)"
    " ON CONFLICT(projection_name) DO UPDATE SET"
    " last_event_id=excluded.last_event_id,"
    " last_global_sequence=excluded.last_global_sequence,"
    " events_processed=projection_position.events_processed+1,"
    " last_processed_at_ms=excluded.last_processed_at_ms;";

static constexpr const char* DELETE_POSITION =
    "DELETE FROM projection_position WHERE projection_name=?;";

// product read model

#define CHRONICLE_PRODUCT_COLUMNS                                                                  \
  "id,sku,name,description,price_cents,price_display,status,search_text,aggregate_version,"        \
  "COALESCE(last_event_id,''),created_at_ms,updated_at_ms,deleted"

// ?1 status, ?2 min price, ?3 max price (NULL = any), ?4 search term ('' = any),
// ?5 include deleted
#define CHRONICLE_PRODUCT_FILTER                                                                   \
  " WHERE (?1 IS NULL OR status=?1)"                                                               \
  " AND (?2 IS NULL OR price_cents>=?2)"                                                           \
  " AND (?3 IS NULL OR price_cents<=?3)"                                                           \
  " AND (?4='' OR instr(LOWER(search_text),LOWER(?4))>0)"                                          \
  " AND (?5=1 OR deleted=0)"

static constexpr const char* UPSERT_PRODUCT =
    "INSERT INTO product_view(id,sku,name,description,price_cents,price_display,status,search_text,"
    "aggregate_version,last_event_id,created_at_ms,updated_at_ms,deleted)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " sku=excluded.sku,name=excluded.name,description=excluded.description,"
    "price_cents=excluded.price_cents,price_display=excluded.price_display,status=excluded.status,"
    "search_text=excluded.search_text,aggregate_version=excluded.aggregate_version,"
    "last_event_id=excluded.last_event_id,created_at_ms=excluded.created_at_ms,"
    "updated_at_ms=excluded.updated_at_ms,deleted=excluded.deleted;";

static constexpr const char* SELECT_PRODUCT =
    "SELECT " CHRONICLE_PRODUCT_COLUMNS " FROM product_view WHERE id=?;";

static constexpr const char* SELECT_PRODUCT_BY_SKU =
    "SELECT " CHRONICLE_PRODUCT_COLUMNS " FROM product_view WHERE sku=? AND deleted=0 ORDER BY id ASC LIMIT 1;";

// ?6 limit (-1 = all), ?7 offset
static constexpr const char* QUERY_PRODUCTS_BY_NAME =
    "SELECT " CHRONICLE_PRODUCT_COLUMNS " FROM product_view" CHRONICLE_PRODUCT_FILTER
    " ORDER BY name ASC, id ASC LIMIT ?6 OFFSET ?7;";

static constexpr const char* QUERY_PRODUCTS_BY_PRICE =
    "SELECT " CHRONICLE_PRODUCT_COLUMNS " FROM product_view" CHRONICLE_PRODUCT_FILTER
    " ORDER BY price_cents ASC, id ASC LIMIT ?6 OFFSET ?7;";

static constexpr const char* QUERY_PRODUCTS_NEWEST =
    "SELECT " CHRONICLE_PRODUCT_COLUMNS " FROM product_view" CHRONICLE_PRODUCT_FILTER
    " ORDER BY created_at_ms DESC, id DESC LIMIT ?6 OFFSET ?7;";

static constexpr const char* COUNT_PRODUCTS =
    "SELECT COUNT(*) FROM product_view" CHRONICLE_PRODUCT_FILTER ";";

#undef CHRONICLE_PRODUCT_FILTER
#undef CHRONICLE_PRODUCT_COLUMNS

static constexpr const char* DELETE_ALL_PRODUCTS =
    "DELETE FROM product_view;";

} // namespace chronicle::db::sql
