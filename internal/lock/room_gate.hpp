#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>

#include "internal/lock/cancellation.hpp"

namespace roombook::lock {

enum class AcquireStatus {
  kAcquired,
  kTimedOut,
  kCancelled,
};

/*
  FIFO mutual exclusion for one room.

  Waiters take a ticket and are admitted strictly in arrival order. A waiter
  that times out or is cancelled withdraws its ticket without side effects.
*/
class RoomGate {
 public:
  AcquireStatus Acquire(std::chrono::milliseconds timeout, const CancellationToken* cancel);

  void Release();

 private:
  // Upper bound on how long a waiter sleeps before re-checking its token.
  static constexpr std::chrono::milliseconds kCancelPollInterval{10};

  std::mutex                mutex_;
  std::condition_variable   cv_;
  std::deque<std::uint64_t> queue_;
  std::uint64_t             next_ticket_ = 0;
  bool                      held_        = false;
};

} // namespace roombook::lock
