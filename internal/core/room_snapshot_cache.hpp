#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/booking.hpp"

namespace roombook::core {

/*
  Immutable view of one room's active occurrences, sorted by start.
  Readers hold the shared_ptr; publishers swap in a new one.
*/
struct RoomSnapshot {
  std::string                    room_id;
  std::uint64_t                  generation = 0;
  std::vector<model::Occurrence> occurrences;
};

/*
  Snapshot cache consistency model:
  - Publish() is called after every committed admission or cancellation,
    while the room gate is still held, so publishes for one room are
    serialized and a later publish always reflects a later commit.
  - Readers never take the room gate. A miss is filled from the repository
    through InstallIfAbsent(); if a publish won the race the published
    snapshot is kept and returned, never the (possibly older) loaded one.
  - Out-of-band repository writes are not observed until Invalidate().
*/
class RoomSnapshotCache {
 public:
  std::shared_ptr<const RoomSnapshot> Find(const std::string& room_id) const;

  std::shared_ptr<const RoomSnapshot> Publish(const std::string& room_id, std::vector<model::Occurrence> occurrences);

  std::shared_ptr<const RoomSnapshot> InstallIfAbsent(const std::string& room_id, std::vector<model::Occurrence> occurrences);

  void Invalidate(const std::string& room_id);

  std::size_t Size() const;

 private:
  static std::shared_ptr<const RoomSnapshot> Make(const std::string& room_id, std::uint64_t generation,
                                                  std::vector<model::Occurrence> occurrences);

  mutable std::shared_mutex                                            mutex_;
  std::unordered_map<std::string, std::shared_ptr<const RoomSnapshot>> snapshots_;
  std::uint64_t                                                        next_generation_ = 1;
};

} // namespace roombook::core
