#include "internal/readmodel/product_catalog.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/readmodel/product_proto.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/faulty_repository.hpp"

namespace {

using chronicle::db::model::ProductQuery;
using chronicle::db::model::ProductSort;
using chronicle::readmodel::ProductCatalog;
using chronicle::readmodel::ProductView;

ProductView Product(const std::string& id, const std::string& name, int64_t price, const std::string& status,
                    uint64_t created_at_ms) {
  ProductView p;
  p.id                = id;
  p.sku               = "SKU-" + id;
  p.name              = name;
  p.price_cents       = price;
  p.price_display     = chronicle::readmodel::FormatPrice(price);
  p.status            = status;
  p.search_text       = chronicle::readmodel::BuildSearchText(name, "");
  p.aggregate_version = 1;
  p.created_at_ms     = created_at_ms;
  p.updated_at_ms     = created_at_ms;
  return p;
}

std::vector<std::string> Ids(const std::vector<ProductView>& products) {
  std::vector<std::string> ids;
  for (const auto& p : products)
    ids.push_back(p.id);
  return ids;
}

ProductCatalog Seeded(std::shared_ptr<chronicle::db::Repository> repo) {
  ProductCatalog catalog(std::move(repo));
  catalog.Put(Product("p-1", "Desk Lamp", 1999, "ACTIVE", 100));
  catalog.Put(Product("p-2", "Arc Lamp", 8900, "ACTIVE", 300));
  catalog.Put(Product("p-3", "Office Chair", 15000, "DRAFT", 200));

  auto gone    = Product("p-4", "Lamp Shade", 500, "ACTIVE", 400);
  gone.deleted = true;
  catalog.Put(gone);
  return catalog;
}

void TestLookups() {
  auto catalog = Seeded(std::make_shared<chronicle::db::memory::MemoryRepository>());

  assert(catalog.Get("p-1")->name == "Desk Lamp");
  assert(catalog.Get("p-4")->deleted);
  assert(!catalog.Get("p-9").has_value());

  assert(catalog.FindBySku("SKU-p-3")->id == "p-3");
  assert(!catalog.FindBySku("SKU-p-4").has_value());

  assert(catalog.Size() == 4);
  assert(Ids(catalog.List()) == (std::vector<std::string>{"p-2", "p-1", "p-3"}));
  assert(catalog.List(true).size() == 4);
}

void TestStatusPriceAndSearch() {
  auto catalog = Seeded(std::make_shared<chronicle::db::memory::MemoryRepository>());

  assert(Ids(catalog.ListByStatus("ACTIVE", 0, 0)) == (std::vector<std::string>{"p-2", "p-1"}));
  assert(Ids(catalog.ListByStatus("ACTIVE", 1, 1)) == (std::vector<std::string>{"p-1"}));
  assert(catalog.ListByStatus("DISCONTINUED", 10, 0).empty());

  assert(Ids(catalog.ListByPriceRange(0, 10000)) == (std::vector<std::string>{"p-1", "p-2"}));
  assert(Ids(catalog.ListByPriceRange(0, 20000, 1)) == (std::vector<std::string>{"p-1"}));

  bool rejected = false;
  try {
    catalog.ListByPriceRange(500, 100);
  } catch (const chronicle::util::ValidationError&) {
    rejected = true;
  }
  assert(rejected);

  assert(Ids(catalog.Search("LAMP")) == (std::vector<std::string>{"p-2", "p-1"}));
  assert(catalog.Search("lamp", 1).size() == 1);
  assert(catalog.Search("sofa").empty());

  ProductQuery newest;
  newest.sort = ProductSort::kNewest;
  assert(Ids(catalog.Query(newest)) == (std::vector<std::string>{"p-2", "p-3", "p-1"}));

  ProductQuery lamps;
  lamps.search          = "lamp";
  lamps.include_deleted = true;
  assert(catalog.Count(lamps) == 3);
}

void TestClear() {
  auto catalog = Seeded(std::make_shared<chronicle::db::memory::MemoryRepository>());
  catalog.Clear();
  assert(catalog.Size() == 0);
  assert(!catalog.Get("p-1").has_value());
}

void TestStorageFailuresSurface() {
  auto repo          = std::make_shared<chronicle::testing::FaultyRepository>();
  auto catalog       = Seeded(repo);
  repo->fail_products = true;

  int failures = 0;
  try {
    catalog.Get("p-1");
  } catch (const chronicle::util::StorageError& e) {
    assert(e.code() == chronicle::db::ErrorCode::IOError);
    ++failures;
  }
  try {
    catalog.Put(Product("p-5", "Stool", 100, "DRAFT", 500));
  } catch (const chronicle::util::StorageError&) {
    ++failures;
  }
  try {
    catalog.Clear();
  } catch (const chronicle::util::StorageError&) {
    ++failures;
  }
  assert(failures == 3);

  repo->fail_products = false;
  assert(catalog.Size() == 4);
}

void TestProductShape() {
  auto catalog = Seeded(std::make_shared<chronicle::db::memory::MemoryRepository>());

  auto proto = chronicle::readmodel::ToProto(*catalog.Get("p-1"));
  assert(proto.id() == "p-1");
  assert(proto.sku() == "SKU-p-1");
  assert(proto.price_cents() == 1999);
  assert(proto.price_display() == "$19.99");
  assert(proto.version() == 1);
  assert(proto.created_at().nanos() == 100000000);
  assert(!proto.deleted());

  ProductQuery active;
  active.status = "ACTIVE";
  active.limit  = 1;
  auto page     = chronicle::readmodel::ToProto(catalog.Query(active), catalog.Count(active));
  assert(page.products_size() == 1);
  assert(page.products(0).id() == "p-2");
  assert(page.total() == 2);
}

} // namespace

int main() {
  TestLookups();
  TestStatusPriceAndSearch();
  TestClear();
  TestStorageFailuresSurface();
  TestProductShape();

  std::cout << "chronicle_unit_product_catalog: pass\n";
  return 0;
}
