#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace booking::util {

/*
  Identifier helpers

  Record ids are RFC4122 v4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

std::string NewId();

// Human-facing booking reference drawn from [A-Z0-9].
std::string GenerateConfirmationCode(std::size_t length = 6);

} // namespace booking::util
