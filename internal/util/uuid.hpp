#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace chatlog::util {

/*
  UUID helpers

  Identifiers are random RFC4122 version 4 UUIDs, stored as text.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Shorthand for ToString(GenerateUUID()).
std::string NewId();

} // namespace chatlog::util
