#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/directory/room_directory.hpp"
#include "internal/model/time_range.hpp"

namespace roombook::core {

struct PolicyOptions {
  std::chrono::minutes min_duration{30};
  std::chrono::minutes max_duration{7 * 24 * 60};
  bool                 allow_past_start = false;
};

/*
  Request-level rules applied before admission. Violations throw
  util::InvalidArgument; free-text fields are truncated, not rejected.
*/
class BookingPolicy {
 public:
  static constexpr std::size_t kMaxTitleLength       = 200;
  static constexpr std::size_t kMaxDescriptionLength = 2000;
  static constexpr std::size_t kMaxReasonLength      = 500;

  BookingPolicy(PolicyOptions options, std::shared_ptr<const directory::RoomDirectory> rooms);

  // Unknown room -> util::NotFound.
  void CheckRoom(const std::string& room_id) const;

  // Applied to the base occurrence; every generated occurrence has the same length.
  void CheckRange(const model::TimeRange& range, util::TimePoint now) const;

  void CheckAttendees(const std::string& room_id, const std::optional<std::uint32_t>& attendees) const;

  static std::string Truncate(std::string text, std::size_t max_length);

  const PolicyOptions& Options() const {
    return options_;
  }

 private:
  PolicyOptions                                   options_;
  std::shared_ptr<const directory::RoomDirectory> rooms_;
};

} // namespace roombook::core
