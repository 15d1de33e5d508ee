#include "room_gate.hpp"

#include <algorithm>

namespace roombook::lock {

AcquireStatus RoomGate::Acquire(std::chrono::milliseconds timeout, const CancellationToken* cancel) {
  std::unique_lock lock(mutex_);

  const auto ticket   = next_ticket_++;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  queue_.push_back(ticket);

  auto my_turn = [&] { return !held_ && queue_.front() == ticket; };

  while (!my_turn()) {
    if (cancel && cancel->IsCancelled()) {
      queue_.erase(std::find(queue_.begin(), queue_.end(), ticket));
      cv_.notify_all();
      return AcquireStatus::kCancelled;
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      queue_.erase(std::find(queue_.begin(), queue_.end(), ticket));
      cv_.notify_all();
      return AcquireStatus::kTimedOut;
    }

    auto wake = deadline;
    if (cancel) {
      wake = std::min(deadline, now + kCancelPollInterval);
    }
    cv_.wait_until(lock, wake);
  }

  queue_.pop_front();
  held_ = true;
  return AcquireStatus::kAcquired;
}

void RoomGate::Release() {
  {
    std::lock_guard lock(mutex_);
    held_ = false;
  }
  cv_.notify_all();
}

} // namespace roombook::lock
