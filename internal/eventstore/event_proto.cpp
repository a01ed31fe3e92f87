#include "event_proto.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace chronicle::eventstore {

namespace {

void ParseInto(const std::string& json, google::protobuf::Struct* out, const std::string& event_id) {
  if (json.empty()) return;

  auto status = google::protobuf::util::JsonStringToMessage(json, out);
  if (!status.ok()) {
    throw util::ValidationError("stored event " + event_id + " is not a JSON object: " + std::string(status.message()));
  }
}

} // namespace

chronicle::v1::StoredEvent ToProto(const db::model::EventRecord& event) {
  chronicle::v1::StoredEvent out;
  out.set_event_id(event.event_id);
  out.set_stream_id(event.stream_id);
  out.set_aggregate_type(event.aggregate_type);
  out.set_aggregate_id(event.aggregate_id);
  out.set_event_type(event.event_type);
  out.set_event_schema_version(event.event_schema_version);
  out.set_aggregate_version(event.aggregate_version);
  ParseInto(event.payload, out.mutable_payload(), event.event_id);
  ParseInto(event.metadata, out.mutable_metadata(), event.event_id);
  *out.mutable_occurred_at() = util::ToProto(util::FromUnixMillis(event.occurred_at_ms));
  out.set_causation_id(event.causation_id);
  out.set_correlation_id(event.correlation_id);
  out.set_user_id(event.user_id);
  out.set_global_sequence(event.global_sequence);
  return out;
}

chronicle::v1::EventList ToProto(const std::vector<db::model::EventRecord>& events) {
  chronicle::v1::EventList out;
  for (const auto& e : events)
    *out.add_events() = ToProto(e);
  return out;
}

} // namespace chronicle::eventstore
