#pragma once

#include <vector>

#include "chronicle/v1/admin.pb.h"
#include "internal/db/model/event_record.hpp"

namespace chronicle::eventstore {

// payload / metadata JSON become Struct; empty text becomes an empty Struct.
chronicle::v1::StoredEvent ToProto(const db::model::EventRecord& event);
chronicle::v1::EventList   ToProto(const std::vector<db::model::EventRecord>& events);

} // namespace chronicle::eventstore
