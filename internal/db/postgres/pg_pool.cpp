#include "pg_pool.hpp"

namespace {

constexpr const char* kEventColumns =
    "e.event_id,e.stream_id,s.aggregate_type,s.aggregate_id,e.event_type,e.event_schema_version,"
    "e.aggregate_version,e.payload,e.metadata,e.occurred_at_ms,COALESCE(e.causation_id,''),"
    "COALESCE(e.correlation_id,''),COALESCE(e.user_id,''),e.global_sequence";

constexpr const char* kProductColumns =
    "id,sku,name,description,price_cents,price_display,status,search_text,aggregate_version,"
    "COALESCE(last_event_id,''),created_at_ms,updated_at_ms,deleted";

// $1 status, $2 min price, $3 max price (NULL = any), $4 search term ('' = any),
// $5 include deleted
constexpr const char* kProductFilter =
    " WHERE ($1::text IS NULL OR status=$1::text)"
    " AND ($2::bigint IS NULL OR price_cents>=$2::bigint)"
    " AND ($3::bigint IS NULL OR price_cents<=$3::bigint)"
    " AND ($4::text='' OR POSITION(LOWER($4::text) IN LOWER(search_text))>0)"
    " AND ($5::boolean OR NOT deleted)";

} // namespace

namespace chronicle::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // streams
  conn.prepare("ensure_stream",
               "INSERT INTO event_stream(stream_id,aggregate_type,aggregate_id,version,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,0,$4,$4) ON CONFLICT (aggregate_type,aggregate_id) DO NOTHING");

  conn.prepare("lock_stream",
               "SELECT stream_id,aggregate_type,aggregate_id,version,created_at_ms,updated_at_ms "
               "FROM event_stream WHERE aggregate_type=$1 AND aggregate_id=$2 FOR UPDATE");

  conn.prepare("get_stream",
               "SELECT stream_id,aggregate_type,aggregate_id,version,created_at_ms,updated_at_ms "
               "FROM event_stream WHERE aggregate_type=$1 AND aggregate_id=$2");

  conn.prepare("update_stream_version", "UPDATE event_stream SET version=$2,updated_at_ms=$3 WHERE stream_id=$1");

  // events
  conn.prepare("insert_event",
               "INSERT INTO domain_event(event_id,stream_id,event_type,event_schema_version,aggregate_version,"
               "payload,metadata,occurred_at_ms,causation_id,correlation_id,user_id) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11) RETURNING global_sequence");

  conn.prepare("stream_events", std::string("SELECT ") + kEventColumns +
                                    " FROM domain_event e JOIN event_stream s ON s.stream_id=e.stream_id "
                                    "WHERE e.stream_id=$1 AND e.aggregate_version>$2 ORDER BY e.aggregate_version ASC");

  conn.prepare("events_after", std::string("SELECT ") + kEventColumns +
                                   " FROM domain_event e JOIN event_stream s ON s.stream_id=e.stream_id "
                                   "WHERE e.global_sequence>$1 ORDER BY e.global_sequence ASC LIMIT $2");

  conn.prepare("events_by_correlation", std::string("SELECT ") + kEventColumns +
                                            " FROM domain_event e JOIN event_stream s ON s.stream_id=e.stream_id "
                                            "WHERE e.correlation_id=$1 ORDER BY e.global_sequence ASC");

  conn.prepare("latest_sequence", "SELECT MAX(global_sequence) FROM domain_event");
  conn.prepare("count_after", "SELECT COUNT(*) FROM domain_event WHERE global_sequence>$1");

  // projection positions
  conn.prepare("get_position",
               "SELECT projection_name,COALESCE(last_event_id,''),last_global_sequence,events_processed,last_processed_at_ms "
               "FROM projection_position WHERE projection_name=$1");

  conn.prepare("list_positions",
               "SELECT projection_name,COALESCE(last_event_id,''),last_global_sequence,events_processed,last_processed_at_ms "
               "FROM projection_position ORDER BY projection_name ASC");

  conn.prepare("advance_position",
               "INSERT INTO projection_position(projection_name,last_event_id,last_global_sequence,events_processed,last_processed_at_ms) "
               "VALUES($1,$2,$3,1,$4) ON CONFLICT (projection_name) DO UPDATE SET "
               "last_event_id=EXCLUDED.last_event_id,last_global_sequence=EXCLUDED.last_global_sequence,"
               "events_processed=projection_position.events_processed+1,last_processed_at_ms=EXCLUDED.last_processed_at_ms");

  conn.prepare("delete_position", "DELETE FROM projection_position WHERE projection_name=$1");

  // product read model; names compare bytewise like the other backends
  conn.prepare("upsert_product",
               "INSERT INTO product_view(id,sku,name,description,price_cents,price_display,status,search_text,"
               "aggregate_version,last_event_id,created_at_ms,updated_at_ms,deleted) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13) ON CONFLICT (id) DO UPDATE SET "
               "sku=EXCLUDED.sku,name=EXCLUDED.name,description=EXCLUDED.description,"
               "price_cents=EXCLUDED.price_cents,price_display=EXCLUDED.price_display,status=EXCLUDED.status,"
               "search_text=EXCLUDED.search_text,aggregate_version=EXCLUDED.aggregate_version,"
               "last_event_id=EXCLUDED.last_event_id,created_at_ms=EXCLUDED.created_at_ms,"
               "updated_at_ms=EXCLUDED.updated_at_ms,deleted=EXCLUDED.deleted");

  conn.prepare("get_product", std::string("SELECT ") + kProductColumns + " FROM product_view WHERE id=$1");

  conn.prepare("get_product_by_sku", std::string("SELECT ") + kProductColumns +
                                         " FROM product_view WHERE sku=$1 AND NOT deleted ORDER BY id COLLATE \"C\" ASC LIMIT 1");

  // $6 limit (NULL = all), $7 offset
  conn.prepare("query_products_by_name", std::string("SELECT ") + kProductColumns + " FROM product_view" + kProductFilter +
                                             " ORDER BY name COLLATE \"C\" ASC, id COLLATE \"C\" ASC LIMIT $6 OFFSET $7");

  conn.prepare("query_products_by_price", std::string("SELECT ") + kProductColumns + " FROM product_view" + kProductFilter +
                                              " ORDER BY price_cents ASC, id COLLATE \"C\" ASC LIMIT $6 OFFSET $7");

  conn.prepare("query_products_newest", std::string("SELECT ") + kProductColumns + " FROM product_view" + kProductFilter +
                                            " ORDER BY created_at_ms DESC, id COLLATE \"C\" DESC LIMIT $6 OFFSET $7");

  conn.prepare("count_products", std::string("SELECT COUNT(*) FROM product_view") + kProductFilter);

  conn.prepare("delete_all_products", "DELETE FROM product_view");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace chronicle::db::postgres
