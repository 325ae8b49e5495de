#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace famgraph::util {

/*
  UUID helpers

  Person and relationship ids are RFC4122 v4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Shorthand for ToString(GenerateUUID()).
std::string NewId();

} // namespace famgraph::util
