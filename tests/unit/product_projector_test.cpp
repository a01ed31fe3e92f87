#include "internal/readmodel/product_projector.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/projection/position_store.hpp"
#include "internal/readmodel/product_catalog.hpp"

namespace {

using chronicle::db::model::EventRecord;
using chronicle::readmodel::ProductCatalog;
using chronicle::readmodel::ProductProjector;

struct Fixture {
  std::shared_ptr<chronicle::db::memory::MemoryRepository>        repo    = std::make_shared<chronicle::db::memory::MemoryRepository>();
  std::shared_ptr<ProductCatalog>                                 catalog = std::make_shared<ProductCatalog>(repo);
  std::shared_ptr<chronicle::projection::ProjectionPositionStore> positions =
      std::make_shared<chronicle::projection::ProjectionPositionStore>(repo);
  ProductProjector projector{catalog, positions};
  uint64_t         sequence = 0;

  EventRecord Event(const std::string& product_id, uint64_t version, const std::string& type, const std::string& payload) {
    EventRecord e;
    e.event_id          = product_id + "-v" + std::to_string(version);
    e.aggregate_type    = "Product";
    e.aggregate_id      = product_id;
    e.aggregate_version = version;
    e.event_type        = type;
    e.payload           = payload;
    e.occurred_at_ms    = 1000 * version;
    e.global_sequence   = ++sequence;
    return e;
  }

  void Create(const std::string& id) {
    projector.Apply(Event(id, 1, "ProductCreated",
                          R"({"sku":"SKU-1","name":"Desk Lamp","description":"Warm LED light","priceCents":1205,"status":"DRAFT"})"));
  }
};

void TestCreateBuildsView() {
  Fixture f;
  f.Create("p-1");

  auto p = f.catalog->Get("p-1");
  assert(p.has_value());
  assert(p->sku == "SKU-1");
  assert(p->name == "Desk Lamp");
  assert(p->price_cents == 1205);
  assert(p->price_display == "$12.05");
  assert(p->status == "DRAFT");
  assert(p->search_text == "Desk Lamp Warm LED light");
  assert(p->aggregate_version == 1);
  assert(p->last_event_id == "p-1-v1");
  assert(p->created_at_ms == 1000);
  assert(!p->deleted);
}

void TestLifecycleEvents() {
  Fixture f;
  f.Create("p-1");

  f.projector.Apply(f.Event("p-1", 2, "ProductUpdated", R"({"name":"Floor Lamp","description":null})"));
  auto updated = f.catalog->Get("p-1");
  assert(updated->name == "Floor Lamp");
  assert(updated->description.empty());
  assert(updated->search_text == "Floor Lamp");

  f.projector.Apply(f.Event("p-1", 3, "ProductPriceChanged", R"({"newPriceCents":900,"previousPriceCents":1205})"));
  assert(f.catalog->Get("p-1")->price_display == "$9.00");

  f.projector.Apply(f.Event("p-1", 4, "ProductActivated", R"({"previousStatus":"DRAFT"})"));
  assert(f.catalog->Get("p-1")->status == "ACTIVE");

  f.projector.Apply(f.Event("p-1", 5, "ProductDiscontinued", R"({"previousStatus":"ACTIVE"})"));
  assert(f.catalog->Get("p-1")->status == "DISCONTINUED");

  f.projector.Apply(f.Event("p-1", 6, "ProductDeleted", "{}"));
  auto deleted = f.catalog->Get("p-1");
  assert(deleted.has_value());
  assert(deleted->deleted);
  assert(deleted->aggregate_version == 6);
  assert(deleted->updated_at_ms == 6000);
  assert(f.catalog->List().empty());
  assert(f.catalog->List(true).size() == 1);
}

void TestReplayIsNoOp() {
  Fixture f;
  f.Create("p-1");

  auto rename = f.Event("p-1", 2, "ProductUpdated", R"({"name":"Renamed","description":"x"})");
  f.projector.Apply(rename);
  const auto before = *f.catalog->Get("p-1");

  f.projector.Apply(rename);
  f.Create("p-1");
  f.projector.Apply(f.Event("p-1", 1, "ProductPriceChanged", R"({"newPriceCents":1})"));

  const auto after = *f.catalog->Get("p-1");
  assert(after.name == before.name);
  assert(after.price_cents == before.price_cents);
  assert(after.aggregate_version == 2);
  assert(after.last_event_id == before.last_event_id);
}

void TestUnknownAndOrphanEventsAreIgnored() {
  Fixture f;
  f.projector.Apply(f.Event("p-9", 1, "ProductReviewed", R"({"stars":5})"));
  f.projector.Apply(f.Event("p-9", 2, "ProductUpdated", R"({"name":"ghost"})"));
  assert(f.catalog->Size() == 0);
}

void TestMalformedPayloadThrows() {
  Fixture f;
  bool    threw = false;
  try {
    f.projector.Apply(f.Event("p-1", 1, "ProductCreated", "{oops"));
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);
  assert(f.catalog->Size() == 0);
}

void TestResetAndPosition() {
  Fixture f;
  f.Create("p-1");
  f.Create("p-2");
  assert(f.catalog->Size() == 2);

  auto empty = f.projector.CurrentPosition();
  assert(empty.projection_name == "ProductReadModel");
  assert(!empty.last_global_sequence.has_value());

  EventRecord last;
  last.event_id        = "e-2";
  last.global_sequence = 2;
  f.positions->Advance(f.projector.Name(), last);
  assert(f.projector.CurrentPosition().last_global_sequence == 2u);

  f.projector.Reset();
  assert(f.catalog->Size() == 0);
}

void TestCatalogHelpers() {
  using chronicle::readmodel::BuildSearchText;
  using chronicle::readmodel::FormatPrice;

  assert(FormatPrice(0) == "$0.00");
  assert(FormatPrice(5) == "$0.05");
  assert(FormatPrice(1205) == "$12.05");
  assert(FormatPrice(100000) == "$1000.00");
  assert(BuildSearchText("Lamp", "") == "Lamp");
  assert(BuildSearchText("Lamp", "bright") == "Lamp bright");

  Fixture f;
  f.Create("p-1");
  assert(f.catalog->Search("warm led").size() == 1);
  assert(f.catalog->Search("chair").empty());
}

} // namespace

int main() {
  TestCreateBuildsView();
  TestLifecycleEvents();
  TestReplayIsNoOp();
  TestUnknownAndOrphanEventsAreIgnored();
  TestMalformedPayloadThrows();
  TestResetAndPosition();
  TestCatalogHelpers();

  std::cout << "chronicle_unit_product_projector: pass\n";
  return 0;
}
