#pragma once

#include "event_sink.hpp"

namespace roombook::events {

// Writes each event as one JSON log line.
class LogEventSink final : public EventSink {
 public:
  void Publish(const roombook::v1::BookingEvent& event) override;
};

// Discards events; for deployments without a dispatcher.
class NullEventSink final : public EventSink {
 public:
  void Publish(const roombook::v1::BookingEvent&) override {
  }
};

} // namespace roombook::events
