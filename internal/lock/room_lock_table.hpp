#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/lock/room_gate.hpp"

namespace roombook::lock {

/*
  RAII ownership of one room's gate. Empty when acquisition failed.
*/
class RoomGuard {
 public:
  RoomGuard() = default;
  RoomGuard(std::shared_ptr<RoomGate> gate, AcquireStatus status);
  ~RoomGuard();

  RoomGuard(RoomGuard&& other) noexcept;
  RoomGuard& operator=(RoomGuard&& other) noexcept;

  RoomGuard(const RoomGuard&)            = delete;
  RoomGuard& operator=(const RoomGuard&) = delete;

  bool OwnsRoom() const {
    return status_ == AcquireStatus::kAcquired && gate_ != nullptr;
  }
  AcquireStatus Status() const {
    return status_;
  }

 private:
  void Reset();

  std::shared_ptr<RoomGate> gate_;
  AcquireStatus             status_ = AcquireStatus::kTimedOut;
};

/*
  Arena of per-room gates, created lazily and never shared between rooms.
  The table mutex only guards the map; waiting happens on the gate itself,
  so rooms never block each other.
*/
class RoomLockTable {
 public:
  RoomGuard Acquire(const std::string& room_id, std::chrono::milliseconds timeout, const CancellationToken* cancel = nullptr);

  std::size_t Size();

 private:
  std::shared_ptr<RoomGate> Gate(const std::string& room_id);

  std::mutex                                                 mutex_;
  std::unordered_map<std::string, std::shared_ptr<RoomGate>> gates_;
};

} // namespace roombook::lock
