#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace chronicle::db::model {

/*
  One row of the product read model.

  Written only by the product projector. aggregate_version is the version
  of the last event applied; deleted rows stay in the table.
*/

struct ProductRecord {
  std::string id; // product aggregate id
  std::string sku;
  std::string name;
  std::string description;
  int64_t     price_cents = 0;
  std::string price_display;
  std::string status;
  std::string search_text;

  uint64_t    aggregate_version = 0;
  std::string last_event_id;
  uint64_t    created_at_ms = 0;
  uint64_t    updated_at_ms = 0;
  bool        deleted       = false;
};

enum class ProductSort {
  kName,     // name, then id
  kPriceAsc, // price_cents, then id
  kNewest,   // created_at_ms descending, then id descending
};

/*
  Filter for listing and counting products. Empty optionals and an empty
  search term match everything. limit == 0 means no limit.
*/
struct ProductQuery {
  std::optional<std::string> status;
  std::optional<int64_t>     min_price_cents;
  std::optional<int64_t>     max_price_cents;
  std::string                search; // case-insensitive substring of search_text

  bool        include_deleted = false;
  ProductSort sort            = ProductSort::kName;
  uint64_t    limit           = 0;
  uint64_t    offset          = 0;
};

} // namespace chronicle::db::model
