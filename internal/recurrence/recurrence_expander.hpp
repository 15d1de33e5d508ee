#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "internal/model/recurrence.hpp"
#include "internal/model/time_range.hpp"

namespace roombook::recurrence {

/*
  Hard ceiling on expansion, independent of the pattern's own bound.
  Protects against unbounded generation from malformed or hostile input.
*/
struct Horizon {
  std::size_t                    max_occurrences = 500;
  std::optional<util::TimePoint> latest_start;
};

struct Expansion {
  std::vector<model::TimeRange> ranges;
  // True when the horizon cut the series short of its own bound.
  bool truncated = false;
};

/*
  Expands a base occurrence + pattern into concrete, ascending ranges.

  Pure function of its inputs. All calendar arithmetic is in UTC.

  Policy notes:
  - count counts emitted occurrences; end_date is inclusive on start.
  - weekly: weeks are Monday-anchored, the base week is week 0, dates before
    the base date are skipped, and an empty days_of_week means the base weekday.
  - monthly: the base day-of-month is kept; months without that day (e.g. the
    31st in a 30-day month, Feb 29 outside leap years) are SKIPPED, never rolled
    over to the month end. Skipped months do not consume count.

  Throws util::InvalidRecurrence for interval <= 0 or above MaxInterval(),
  count <= 0, both or neither of end_date/count, or end_date before the base
  start.
*/
class RecurrenceExpander {
 public:
  // Widest step per frequency; each is about ten years.
  static constexpr int kMaxDailyInterval   = 3660;
  static constexpr int kMaxWeeklyInterval  = 522;
  static constexpr int kMaxMonthlyInterval = 120;

  static int MaxInterval(model::Frequency frequency);

  static void Validate(const model::TimeRange& base, const model::RecurrencePattern& pattern);

  static Expansion Expand(const model::TimeRange& base, const model::RecurrencePattern& pattern, const Horizon& horizon);
};

} // namespace roombook::recurrence
