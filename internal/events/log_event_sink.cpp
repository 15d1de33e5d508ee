#include "log_event_sink.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"

namespace roombook::events {

void LogEventSink::Publish(const roombook::v1::BookingEvent& event) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(event, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize booking event: " + std::string(status.message()));
  }
  ROOMBOOK_LOG_INFO("booking event", {observability::StringField("event", json)});
}

} // namespace roombook::events
