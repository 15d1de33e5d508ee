#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "roombook/v1/events.pb.h"

namespace roombook::events {

/*
  Thread-safe blocking queue between the booking manager and the dispatcher.
  Enqueue never blocks on delivery.
*/
class EventQueue {
 public:
  void Enqueue(roombook::v1::BookingEvent event);

  // blocking wait
  std::optional<roombook::v1::BookingEvent> Dequeue();

  void Shutdown();

  std::size_t Size();

 private:
  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::queue<roombook::v1::BookingEvent> queue_;
  bool                                   shutdown_ = false;
};

} // namespace roombook::events
