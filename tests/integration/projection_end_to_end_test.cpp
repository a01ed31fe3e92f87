#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/eventstore/event_query_service.hpp"
#include "internal/eventstore/event_store.hpp"
#include "internal/factory.hpp"
#include "internal/projection/position_store.hpp"
#include "internal/projection/projection_runner.hpp"
#include "internal/readmodel/product_catalog.hpp"

namespace {

using namespace std::chrono_literals;

using chronicle::config::ConfigLoader;
using chronicle::eventstore::NewEvent;
using chronicle::factory::BuildRuntime;
using chronicle::factory::RuntimeDependencies;

NewEvent Event(const std::string& type, const std::string& payload) {
  NewEvent e;
  e.event_type = type;
  e.payload    = payload;
  return e;
}

bool WaitFor(const std::function<bool()>& predicate) {
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return predicate();
}

void SeedCatalog(RuntimeDependencies& rt) {
  rt.event_store->AppendEvents(
      "Product", "lamp", 0,
      {Event("ProductCreated", R"({"sku":"L-1","name":"Desk Lamp","description":"Warm LED light","priceCents":2500})"),
       Event("ProductPriceChanged", R"({"newPriceCents":1999,"previousPriceCents":2500})"),
       Event("ProductActivated", R"({"previousStatus":"DRAFT"})")});

  rt.event_store->AppendEvents("Product", "chair", 0,
                               {Event("ProductCreated", R"({"sku":"C-1","name":"Office Chair","priceCents":15000})")});
}

void VerifySeededCatalog(const chronicle::readmodel::ProductCatalog& catalog) {
  auto lamp = catalog.Get("lamp");
  assert(lamp.has_value());
  assert(lamp->price_cents == 1999);
  assert(lamp->price_display == "$19.99");
  assert(lamp->status == "ACTIVE");
  assert(lamp->aggregate_version == 3);

  auto chair = catalog.Get("chair");
  assert(chair.has_value());
  assert(chair->status == "DRAFT");

  assert(catalog.Search("led").size() == 1);
  assert(catalog.List().size() == 2);
}

void RunLiveProjection(RuntimeDependencies& rt) {
  SeedCatalog(rt);

  assert(rt.runner->Start());
  VerifySeededCatalog(*rt.catalog);

  // events appended while running reach the read model through polling
  rt.event_store->AppendEvents("Product", "chair", 1, {Event("ProductDeleted", "{}")});
  assert(WaitFor([&] { return rt.catalog->List().size() == 1; }));
  assert(rt.catalog->List(true).size() == 2);

  auto health = rt.runner->Health();
  assert(health.healthy);
  assert(health.details.at("running") == "true");

  const auto before = rt.catalog->List(true);
  auto       result = rt.runner->Rebuild();
  assert(result.success);
  assert(result.events_processed == 5);
  assert(rt.runner->IsRunning());

  const auto after = rt.catalog->List(true);
  assert(after.size() == before.size());
  for (size_t i = 0; i < after.size(); ++i) {
    assert(after[i].id == before[i].id);
    assert(after[i].price_cents == before[i].price_cents);
    assert(after[i].status == before[i].status);
    assert(after[i].deleted == before[i].deleted);
    assert(after[i].aggregate_version == before[i].aggregate_version);
  }

  rt.runner->Stop();

  auto status = rt.runner->Status();
  assert(status.events_processed == 5);
  assert(status.event_lag == 0);
  assert(status.last_global_sequence == rt.queries->LatestSequence());
}

void TestMemoryBackend() {
  auto config = ConfigLoader::LoadFromYamlString("projection:\n  poll_interval: 10ms\n");
  auto rt     = BuildRuntime(config);
  RunLiveProjection(rt);
}

#if CHRONICLE_DB_SQLITE
void TestSqliteBackendKeepsReadModelAcrossRestart() {
  const auto stamp   = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto db_path = (std::filesystem::temp_directory_path() / ("chronicle_e2e_" + std::to_string(stamp) + ".db")).string();

  const std::string yaml = "database:\n  sqlite:\n    path: \"" + db_path +
                           "\"\nprojection:\n  name: CatalogView\n  poll_interval: 10ms\n  batch_size: 2\n";

  std::vector<chronicle::readmodel::ProductView> live;
  {
    auto rt = BuildRuntime(ConfigLoader::LoadFromYamlString(yaml));
    assert(rt.projection_config.name == "CatalogView");
    RunLiveProjection(rt);
    live = rt.catalog->List(true);
  }

  auto rt       = BuildRuntime(ConfigLoader::LoadFromYamlString(yaml));
  auto position = rt.positions->Get("CatalogView");
  assert(position.has_value());
  assert(position->events_processed == 5);

  // read model and position come back together
  const auto restored = rt.catalog->List(true);
  assert(restored.size() == live.size());
  for (size_t i = 0; i < restored.size(); ++i) {
    assert(restored[i].id == live[i].id);
    assert(restored[i].price_cents == live[i].price_cents);
    assert(restored[i].status == live[i].status);
    assert(restored[i].deleted == live[i].deleted);
    assert(restored[i].aggregate_version == live[i].aggregate_version);
  }

  // an event appended while the projector was down updates the stored product
  rt.event_store->AppendEvents("Product", "lamp", 3,
                               {Event("ProductPriceChanged", R"({"newPriceCents":1750,"previousPriceCents":1999})")});

  assert(rt.runner->Start());
  auto lamp = rt.catalog->Get("lamp");
  assert(lamp.has_value());
  assert(lamp->price_cents == 1750);
  assert(lamp->price_display == "$17.50");
  assert(lamp->aggregate_version == 4);
  assert(rt.catalog->FindBySku("L-1")->id == "lamp");
  assert(rt.runner->Status().event_lag == 0);
  rt.runner->Stop();

  auto result = rt.runner->Rebuild();
  assert(result.success);
  assert(result.events_processed == 6);
  assert(rt.catalog->List(true).size() == 2);
  assert(rt.catalog->Get("lamp")->price_cents == 1750);
  assert(rt.catalog->Get("chair")->deleted);

  std::error_code ec;
  std::filesystem::remove(db_path, ec);
  std::filesystem::remove(db_path + "-wal", ec);
  std::filesystem::remove(db_path + "-shm", ec);
}
#endif

} // namespace

int main() {
  TestMemoryBackend();
#if CHRONICLE_DB_SQLITE
  TestSqliteBackendKeepsReadModelAcrossRestart();
#endif

  std::cout << "chronicle_integration_projection_end_to_end: pass\n";
  return 0;
}
