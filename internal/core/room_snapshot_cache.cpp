#include "room_snapshot_cache.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace roombook::core {

std::shared_ptr<const RoomSnapshot> RoomSnapshotCache::Make(const std::string& room_id, std::uint64_t generation,
                                                            std::vector<model::Occurrence> occurrences) {
  std::sort(occurrences.begin(), occurrences.end(), [](const auto& a, const auto& b) {
    return model::StartsBefore(a.range, b.range);
  });

  auto snapshot         = std::make_shared<RoomSnapshot>();
  snapshot->room_id     = room_id;
  snapshot->generation  = generation;
  snapshot->occurrences = std::move(occurrences);
  return snapshot;
}

std::shared_ptr<const RoomSnapshot> RoomSnapshotCache::Find(const std::string& room_id) const {
  std::shared_lock lock(mutex_);
  auto             it = snapshots_.find(room_id);
  if (it == snapshots_.end()) return nullptr;
  return it->second;
}

std::shared_ptr<const RoomSnapshot> RoomSnapshotCache::Publish(const std::string& room_id, std::vector<model::Occurrence> occurrences) {
  std::unique_lock lock(mutex_);
  auto             snapshot = Make(room_id, next_generation_++, std::move(occurrences));
  snapshots_[room_id]       = snapshot;
  return snapshot;
}

std::shared_ptr<const RoomSnapshot> RoomSnapshotCache::InstallIfAbsent(const std::string& room_id, std::vector<model::Occurrence> occurrences) {
  std::unique_lock lock(mutex_);
  if (auto it = snapshots_.find(room_id); it != snapshots_.end()) {
    return it->second;
  }
  auto snapshot = Make(room_id, next_generation_++, std::move(occurrences));
  snapshots_.emplace(room_id, snapshot);
  return snapshot;
}

void RoomSnapshotCache::Invalidate(const std::string& room_id) {
  std::unique_lock lock(mutex_);
  snapshots_.erase(room_id);
}

std::size_t RoomSnapshotCache::Size() const {
  std::shared_lock lock(mutex_);
  return snapshots_.size();
}

} // namespace roombook::core
