#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace storygraph::util {

/*
  UUID helpers

  Snippet ids are random RFC4122 v4 UUIDs rendered as 32 lowercase hex
  characters without dashes.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToHex(const UUID& id);

// Fresh snippet id.
std::string NewId();

} // namespace storygraph::util
