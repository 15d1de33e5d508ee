#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace roombook::util {

/*
  UUID helpers

  Booking ids are random RFC4122 version 4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

std::string GenerateBookingId();

} // namespace roombook::util
