#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace chronicle::util {

/*
  Clock and timestamp helpers.

  Stored timestamps are unix milliseconds (UTC).
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

uint64_t NowMillis();

// RFC3339, e.g. 2026-01-02T03:04:05.678Z
std::string FormatUnixMillis(uint64_t ms);

} // namespace chronicle::util
