#include "static_room_directory.hpp"

#include <utility>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace roombook::directory {

StaticRoomDirectory::StaticRoomDirectory(const std::vector<RoomEntry>& rooms) {
  for (const auto& room : rooms) {
    if (room.id.empty()) {
      throw util::InvalidArgument("room id must not be empty");
    }
    if (!rooms_.emplace(room.id, room.capacity).second) {
      throw util::InvalidArgument("duplicate room id: " + room.id);
    }
  }
}

StaticRoomDirectory StaticRoomDirectory::FromConfig(const roombook::runtime::config::RuntimeConfig& config) {
  std::vector<RoomEntry> rooms;
  rooms.reserve(static_cast<std::size_t>(config.rooms_size()));
  for (const auto& room : config.rooms()) {
    RoomEntry entry{.id = room.id(), .capacity = std::nullopt};
    if (room.capacity() > 0) entry.capacity = room.capacity();
    rooms.push_back(std::move(entry));
  }
  return StaticRoomDirectory(rooms);
}

bool StaticRoomDirectory::RoomExists(const std::string& room_id) const {
  return rooms_.empty() || rooms_.contains(room_id);
}

std::optional<std::uint32_t> StaticRoomDirectory::Capacity(const std::string& room_id) const {
  auto it = rooms_.find(room_id);
  if (it == rooms_.end()) return std::nullopt;
  return it->second;
}

} // namespace roombook::directory
