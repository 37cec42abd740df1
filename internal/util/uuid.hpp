#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace jobsrv::util {

/*
  UUID helpers

  Group and job identities are random RFC4122 v4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

inline std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace jobsrv::util
