#pragma once

#include <atomic>

namespace roombook::lock {

/*
  Caller-side abort flag for a request that is still waiting for its room.
  Once the room is held the admission always runs to completion.
*/
class CancellationToken {
 public:
  void Cancel() {
    cancelled_.store(true, std::memory_order_release);
  }

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

} // namespace roombook::lock
