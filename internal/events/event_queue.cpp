#include "event_queue.hpp"

#include <utility>

namespace roombook::events {

void EventQueue::Enqueue(roombook::v1::BookingEvent event) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(std::move(event));
  }
  cv_.notify_one();
}

std::optional<roombook::v1::BookingEvent> EventQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  // Drain what is already queued before honoring shutdown.
  if (queue_.empty()) return std::nullopt;

  auto event = std::move(queue_.front());
  queue_.pop();
  return event;
}

void EventQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t EventQueue::Size() {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace roombook::events
