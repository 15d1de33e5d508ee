#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/recurrence.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/model/time_range.hpp"

namespace roombook::model {

/*
  One concrete scheduled instance of a booking. Generated, never mutated.
*/
struct Occurrence {
  std::string   booking_id;
  TimeRange     range;
  std::uint32_t sequence_index = 0;

  bool operator==(const Occurrence&) const = default;
};

struct Booking {
  std::string id;
  std::string room_id;
  std::string user_id;

  std::string                  title;
  std::string                  description;
  std::optional<std::uint32_t> attendees;

  // Base occurrence; the series is derived from it and `recurrence`.
  TimeRange                        range;
  std::optional<RecurrencePattern> recurrence;

  BookingState            state = BookingState::kPending;
  std::vector<Occurrence> occurrences;

  // Incremented on every state or schedule mutation.
  std::uint64_t version = 0;

  std::string                    cancellation_reason;
  std::string                    cancelled_by;
  std::optional<util::TimePoint> cancelled_at;

  util::TimePoint created_at{};
  util::TimePoint updated_at{};
};

enum class Role : std::uint8_t {
  kUser            = 0,
  kFacilityManager = 1,
  kAdmin           = 2,
  kAuditor         = 3,
  kService         = 4,
};

// Already authenticated and authorized upstream; trusted as-is.
struct Actor {
  std::string user_id;
  Role        role = Role::kUser;
};

constexpr bool CanOverride(Role role) {
  return role == Role::kAdmin || role == Role::kFacilityManager;
}

constexpr bool CanAudit(Role role) {
  return role == Role::kAdmin || role == Role::kFacilityManager || role == Role::kAuditor;
}

std::string_view    ToString(Role role);
std::optional<Role> ParseRole(std::string_view text);

} // namespace roombook::model
