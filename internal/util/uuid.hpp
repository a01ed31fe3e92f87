#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace chronicle::util {

/*
  UUID helpers

  Event and stream ids are random RFC4122 v4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// GenerateUUID() rendered with ToString().
std::string NewUuidString();

} // namespace chronicle::util
