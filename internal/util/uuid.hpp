#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace ledger::util {

/*
  UUID helpers

  Record ids and fencing tokens are RFC4122 v4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Canonical 8-4-4-4-12 hex form.
bool IsUUID(std::string_view str);

std::string GenerateUUIDString();

} // namespace ledger::util
