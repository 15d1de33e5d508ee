#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

#include "event_queue.hpp"
#include "event_sink.hpp"

namespace roombook::events {

struct DispatchOptions {
  std::uint32_t             max_delivery_attempts = 5;
  std::chrono::milliseconds retry_backoff{100};
};

/*
  Background worker that drains the queue into the sink.

  Failed deliveries are retried with linear backoff; an event that exhausts
  its attempts is logged and dropped. Booking state never depends on this.
*/
class EventDispatcher {
 public:
  EventDispatcher(std::shared_ptr<EventQueue> queue, std::shared_ptr<EventSink> sink, DispatchOptions options = {});
  ~EventDispatcher();

  EventDispatcher(const EventDispatcher&)            = delete;
  EventDispatcher& operator=(const EventDispatcher&) = delete;

  void Start();
  // Delivers everything already queued, then joins.
  void Stop();

  std::uint64_t Delivered() const {
    return delivered_.load();
  }
  std::uint64_t Dropped() const {
    return dropped_.load();
  }

 private:
  void Run();
  void Deliver(const roombook::v1::BookingEvent& event);

  std::shared_ptr<EventQueue> queue_;
  std::shared_ptr<EventSink>  sink_;
  DispatchOptions             options_;

  std::thread                thread_;
  std::atomic<bool>          running_{false};
  std::atomic<std::uint64_t> delivered_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

} // namespace roombook::events
