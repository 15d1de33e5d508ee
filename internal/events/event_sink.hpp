#pragma once

#include "roombook/v1/events.pb.h"

namespace roombook::events {

/*
  External event dispatcher boundary.

  Publish() throws on delivery failure; the dispatcher retries. Sinks must
  tolerate duplicates (delivery is at-least-once).
*/
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void Publish(const roombook::v1::BookingEvent& event) = 0;
};

} // namespace roombook::events
