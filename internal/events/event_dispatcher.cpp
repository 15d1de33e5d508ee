#include "event_dispatcher.hpp"

#include <utility>

#include "internal/observability/logging.hpp"

namespace roombook::events {

using roombook::observability::IntField;
using roombook::observability::StringField;

EventDispatcher::EventDispatcher(std::shared_ptr<EventQueue> queue, std::shared_ptr<EventSink> sink, DispatchOptions options)
    : queue_(std::move(queue)), sink_(std::move(sink)), options_(options) {
}

EventDispatcher::~EventDispatcher() {
  Stop();
}

void EventDispatcher::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&EventDispatcher::Run, this);
}

void EventDispatcher::Stop() {
  queue_->Shutdown();
  running_ = false;
  if (thread_.joinable())
    thread_.join();
}

void EventDispatcher::Run() {
  while (true) {
    auto event = queue_->Dequeue();
    if (!event)
      break;

    Deliver(*event);
  }
}

void EventDispatcher::Deliver(const roombook::v1::BookingEvent& event) {
  const auto attempts = options_.max_delivery_attempts == 0 ? 1 : options_.max_delivery_attempts;

  for (std::uint32_t attempt = 1; attempt <= attempts; ++attempt) {
    try {
      sink_->Publish(event);
      ++delivered_;
      return;
    } catch (const std::exception& e) {
      ROOMBOOK_LOG_WARN("event delivery failed", {StringField("booking_id", event.booking_id()),
                                                  StringField("event_type", roombook::v1::BookingEventType_Name(event.event_type())),
                                                  IntField("attempt", attempt), StringField("error", e.what())});
    }
    if (attempt < attempts) {
      std::this_thread::sleep_for(options_.retry_backoff * attempt);
    }
  }

  ++dropped_;
  ROOMBOOK_LOG_ERROR("event dropped after retries", {StringField("booking_id", event.booking_id()),
                                                     IntField("version", static_cast<std::int64_t>(event.version()))});
}

} // namespace roombook::events
