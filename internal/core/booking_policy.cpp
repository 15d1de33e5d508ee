#include "booking_policy.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace roombook::core {

BookingPolicy::BookingPolicy(PolicyOptions options, std::shared_ptr<const directory::RoomDirectory> rooms)
    : options_(options), rooms_(std::move(rooms)) {
  if (options_.min_duration > options_.max_duration) {
    throw util::InvalidArgument("booking policy: min duration exceeds max duration");
  }
}

void BookingPolicy::CheckRoom(const std::string& room_id) const {
  if (room_id.empty()) {
    throw util::InvalidArgument("room id is required");
  }
  if (rooms_ && !rooms_->RoomExists(room_id)) {
    throw util::NotFound("room not found: " + room_id);
  }
}

void BookingPolicy::CheckRange(const model::TimeRange& range, util::TimePoint now) const {
  const auto duration = range.duration();
  if (duration < options_.min_duration) {
    throw util::InvalidArgument("booking must be at least " + std::to_string(options_.min_duration.count()) + " minutes");
  }
  if (duration > options_.max_duration) {
    throw util::InvalidArgument("booking must not exceed " + std::to_string(options_.max_duration.count()) + " minutes");
  }
  if (!options_.allow_past_start && range.start() < now) {
    throw util::InvalidArgument("booking cannot start in the past");
  }
}

void BookingPolicy::CheckAttendees(const std::string& room_id, const std::optional<std::uint32_t>& attendees) const {
  if (!attendees) return;
  if (*attendees == 0) {
    throw util::InvalidArgument("attendees must be positive");
  }
  if (!rooms_) return;

  const auto capacity = rooms_->Capacity(room_id);
  if (capacity && *attendees > *capacity) {
    throw util::InvalidArgument("attendees (" + std::to_string(*attendees) + ") exceed capacity of room " + room_id + " (" +
                                std::to_string(*capacity) + ")");
  }
}

std::string BookingPolicy::Truncate(std::string text, std::size_t max_length) {
  if (text.size() > max_length) text.resize(max_length);
  return text;
}

} // namespace roombook::core
