#include "internal/eventstore/event_proto.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

void TestStoredEventShape() {
  chronicle::db::model::EventRecord e;
  e.event_id          = "e-1";
  e.stream_id         = "s-1";
  e.aggregate_type    = "Product";
  e.aggregate_id      = "p-1";
  e.event_type        = "ProductCreated";
  e.aggregate_version = 1;
  e.payload           = R"({"sku":"A-1","priceCents":100})";
  e.occurred_at_ms    = 1700000000123;
  e.global_sequence   = 42;

  auto proto = chronicle::eventstore::ToProto(e);
  assert(proto.event_id() == "e-1");
  assert(proto.global_sequence() == 42);
  assert(proto.payload().fields().at("sku").string_value() == "A-1");
  assert(proto.payload().fields().at("priceCents").number_value() == 100);
  assert(proto.metadata().fields().empty());
  assert(proto.occurred_at().seconds() == 1700000000);
  assert(proto.occurred_at().nanos() == 123000000);

  auto list = chronicle::eventstore::ToProto(std::vector<chronicle::db::model::EventRecord>{e, e});
  assert(list.events_size() == 2);
}

void TestCorruptPayloadRejected() {
  chronicle::db::model::EventRecord e;
  e.event_id = "e-bad";
  e.payload  = "[]";

  bool threw = false;
  try {
    chronicle::eventstore::ToProto(e);
  } catch (const chronicle::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestStoredEventShape();
  TestCorruptPayloadRejected();

  std::cout << "chronicle_unit_event_proto: pass\n";
  return 0;
}
