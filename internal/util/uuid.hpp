#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace kag::util {

/*
  UUID helpers

  Session and document ids are RFC4122 v4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Canonical text form of a fresh v4 UUID.
std::string NewId();

} // namespace kag::util
