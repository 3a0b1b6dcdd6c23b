#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace recall::util {

// Review record and review event ids: RFC4122 v4, canonical 36 char text.
using UUID = std::array<uint8_t, 16>;

UUID        GenerateUUID();
std::string ToString(const UUID& id);

std::string GenerateId();

} // namespace recall::util
