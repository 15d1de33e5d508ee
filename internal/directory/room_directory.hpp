#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace roombook::directory {

/*
  Room Directory collaborator. Rooms themselves are owned elsewhere; the
  engine only asks whether one exists and how many people it seats.
*/
class RoomDirectory {
 public:
  virtual ~RoomDirectory() = default;

  virtual bool RoomExists(const std::string& room_id) const = 0;

  // nullopt when the room is unknown or its capacity is not tracked.
  virtual std::optional<std::uint32_t> Capacity(const std::string& room_id) const = 0;
};

} // namespace roombook::directory
