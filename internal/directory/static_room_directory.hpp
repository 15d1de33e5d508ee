#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/directory/room_directory.hpp"

namespace roombook::runtime::config {
class RuntimeConfig;
}

namespace roombook::directory {

struct RoomEntry {
  std::string                  id;
  std::optional<std::uint32_t> capacity;
};

/*
  Fixed room list, loaded once from the `rooms:` config section.
  An empty list means every room id is accepted.
*/
class StaticRoomDirectory final : public RoomDirectory {
 public:
  explicit StaticRoomDirectory(const std::vector<RoomEntry>& rooms);

  static StaticRoomDirectory FromConfig(const roombook::runtime::config::RuntimeConfig& config);

  bool                         RoomExists(const std::string& room_id) const override;
  std::optional<std::uint32_t> Capacity(const std::string& room_id) const override;

 private:
  std::unordered_map<std::string, std::optional<std::uint32_t>> rooms_;
};

} // namespace roombook::directory
