#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace roombook::model {

enum class Frequency : std::uint8_t {
  kNone    = 0,
  kDaily   = 1,
  kWeekly  = 2,
  kMonthly = 3,
};

// Numbering follows std::chrono::weekday::c_encoding() (Sunday == 0).
enum class Weekday : std::uint8_t {
  kSunday    = 0,
  kMonday    = 1,
  kTuesday   = 2,
  kWednesday = 3,
  kThursday  = 4,
  kFriday    = 5,
  kSaturday  = 6,
};

/*
  Immutable once attached to a booking.

  Exactly one of end_date / count bounds the series (checked by the
  expander, not here, so malformed input can still be represented and
  rejected with a precise message).
*/
struct RecurrencePattern {
  Frequency                      frequency = Frequency::kNone;
  int                            interval  = 1;
  std::optional<util::TimePoint> end_date;
  std::set<Weekday>              days_of_week;
  std::optional<int>             count;

  bool operator==(const RecurrencePattern&) const = default;
};

std::string_view         ToString(Frequency frequency);
std::optional<Frequency> ParseFrequency(std::string_view text);

std::string_view       ToString(Weekday day);
std::optional<Weekday> ParseWeekday(std::string_view text);

// "mon,wed" style list; empty input yields an empty set.
std::string       FormatWeekdays(const std::set<Weekday>& days);
std::set<Weekday> ParseWeekdays(std::string_view text);

} // namespace roombook::model
