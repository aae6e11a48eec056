#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace recsync::util {

/*
  UUID helpers

  Host ids are random (v4). Record ids are time-ordered (v7) so that id order
  roughly follows creation order across hosts.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();
UUID GenerateUUIDv7();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

bool IsUUID(const std::string& str);

// Canonical string forms.
std::string NewHostId();
std::string NewRecordId();

} // namespace recsync::util
