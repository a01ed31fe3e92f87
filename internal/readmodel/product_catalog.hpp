#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/product_record.hpp"

namespace chronicle::db {
class Repository;
}

namespace chronicle::readmodel {

using ProductView = db::model::ProductRecord;

/*
  Product read model, stored through the repository next to the projection
  position so both survive a restart.

  Each call runs in its own transaction. Failures surface as
  util::StorageError. Listings order by name, then id, unless the query
  says otherwise.
*/
class ProductCatalog {
 public:
  explicit ProductCatalog(std::shared_ptr<db::Repository> repository);

  void Put(const ProductView& product);

  // Soft-deleted products are returned too.
  std::optional<ProductView> Get(const std::string& id) const;

  std::optional<ProductView> FindBySku(const std::string& sku) const;

  // Soft-deleted products are left out unless include_deleted.
  std::vector<ProductView> List(bool include_deleted = false) const;

  std::vector<ProductView> ListByStatus(const std::string& status, uint64_t limit, uint64_t offset) const;

  // Inclusive bounds, cheapest first.
  std::vector<ProductView> ListByPriceRange(int64_t min_cents, int64_t max_cents, uint64_t limit = 0) const;

  // Case-insensitive substring match on search_text. limit 0 returns all.
  std::vector<ProductView> Search(const std::string& term, uint64_t limit = 0) const;

  std::vector<ProductView> Query(const db::model::ProductQuery& query) const;
  uint64_t                 Count(const db::model::ProductQuery& query) const;

  void Clear();

  // Every stored product, deleted ones included.
  size_t Size() const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

// 1205 -> "$12.05"
std::string FormatPrice(int64_t cents);

// name and description joined by a space; description optional
std::string BuildSearchText(const std::string& name, const std::string& description);

} // namespace chronicle::readmodel
