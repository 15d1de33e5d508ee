#include "recurrence_expander.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace roombook::recurrence {

namespace {

using std::chrono::days;
using std::chrono::sys_days;
using std::chrono::year_month_day;

/*
  Collects occurrences and decides when to stop. Every candidate goes through
  Offer() in ascending order.

  Dates are compared against the horizon in whole days before any conversion
  to a TimePoint, so a candidate past the clock's range never wraps around.
*/
class Collector {
 public:
  Collector(const model::TimeRange& base, const model::RecurrencePattern& pattern, const Horizon& horizon)
      : offset_(base.start() - std::chrono::floor<days>(base.start())),
        duration_(base.duration()),
        pattern_(pattern),
        horizon_(horizon),
        last_date_(std::chrono::floor<days>(util::TimePoint::max()) - days{1}) {
    if (horizon_.latest_start) {
      last_date_ = std::min(last_date_, std::chrono::floor<days>(*horizon_.latest_start));
    }
  }

  // True (and the series is finished) when date lies past the last usable day.
  bool Beyond(sys_days date) {
    if (date <= last_date_) return false;

    if (pattern_.end_date && date > std::chrono::floor<days>(*pattern_.end_date)) {
      done_ = true;
    } else {
      Truncate();
    }
    return true;
  }

  // Returns false once no further occurrence can be emitted.
  bool Offer(sys_days date) {
    if (Beyond(date)) return false;

    const auto start = util::TimePoint{date} + offset_;

    if (pattern_.end_date && start > *pattern_.end_date) {
      done_ = true;
      return false;
    }
    if (horizon_.latest_start && start > *horizon_.latest_start) {
      Truncate();
      return false;
    }
    if (out_.ranges.size() >= horizon_.max_occurrences) {
      Truncate();
      return false;
    }

    out_.ranges.emplace_back(start, start + duration_);

    if (pattern_.count && out_.ranges.size() >= static_cast<std::size_t>(*pattern_.count)) {
      done_ = true;
      return false;
    }
    return true;
  }

  bool Done() const {
    return done_;
  }

  Expansion Take() {
    return std::move(out_);
  }

 private:
  void Truncate() {
    out_.truncated = true;
    done_          = true;
  }

  util::Clock::duration           offset_;
  util::Clock::duration           duration_;
  const model::RecurrencePattern& pattern_;
  const Horizon&                  horizon_;
  sys_days                        last_date_;
  Expansion                       out_;
  bool                            done_ = false;
};

void ExpandDaily(sys_days base_date, int interval, Collector& collector) {
  for (sys_days date = base_date; collector.Offer(date); date += days{interval}) {
  }
}

void ExpandWeekly(sys_days base_date, const model::RecurrencePattern& pattern, Collector& collector) {
  std::set<model::Weekday> selected = pattern.days_of_week;
  if (selected.empty()) {
    selected.insert(static_cast<model::Weekday>(std::chrono::weekday{base_date}.c_encoding()));
  }

  // Monday of the base week.
  const auto base_iso = std::chrono::weekday{base_date}.iso_encoding();
  const auto monday   = base_date - days{base_iso - 1};

  for (sys_days week = monday; !collector.Done(); week += days{7} * pattern.interval) {
    for (unsigned iso = 1; iso <= 7; ++iso) {
      const auto day = static_cast<model::Weekday>(iso % 7);
      if (!selected.contains(day)) continue;

      const auto date = week + days{iso - 1};
      if (date < base_date) continue;
      if (!collector.Offer(date)) return;
    }
  }
}

void ExpandMonthly(sys_days base_date, int interval, Collector& collector) {
  const year_month_day base{base_date};
  const auto           first_month = base.year() / base.month();

  for (std::int64_t step = 0; !collector.Done(); step += interval) {
    const auto month = first_month + std::chrono::months{step};
    if (collector.Beyond(sys_days{month / std::chrono::day{1}})) return;

    const year_month_day candidate{month.year(), month.month(), base.day()};
    if (!candidate.ok()) {
      continue;
    }
    if (!collector.Offer(sys_days{candidate})) return;
  }
}

} // namespace

int RecurrenceExpander::MaxInterval(model::Frequency frequency) {
  switch (frequency) {
    case model::Frequency::kDaily:
      return kMaxDailyInterval;
    case model::Frequency::kWeekly:
      return kMaxWeeklyInterval;
    case model::Frequency::kMonthly:
      return kMaxMonthlyInterval;
    case model::Frequency::kNone:
      break;
  }
  return 0;
}

void RecurrenceExpander::Validate(const model::TimeRange& base, const model::RecurrencePattern& pattern) {
  if (pattern.frequency == model::Frequency::kNone) {
    return;
  }
  if (pattern.interval <= 0) {
    throw util::InvalidRecurrence("recurrence interval must be positive, got " + std::to_string(pattern.interval));
  }
  if (pattern.interval > MaxInterval(pattern.frequency)) {
    throw util::InvalidRecurrence("recurrence interval " + std::to_string(pattern.interval) + " exceeds the " +
                                  std::string(model::ToString(pattern.frequency)) + " maximum of " +
                                  std::to_string(MaxInterval(pattern.frequency)));
  }
  if (pattern.end_date && pattern.count) {
    throw util::InvalidRecurrence("recurrence must be bounded by exactly one of end_date or count, got both");
  }
  if (!pattern.end_date && !pattern.count) {
    throw util::InvalidRecurrence("unbounded recurrence: one of end_date or count is required");
  }
  if (pattern.count && *pattern.count <= 0) {
    throw util::InvalidRecurrence("recurrence count must be positive, got " + std::to_string(*pattern.count));
  }
  if (pattern.end_date && *pattern.end_date < base.start()) {
    throw util::InvalidRecurrence("recurrence end_date " + util::FormatIso8601(*pattern.end_date) + " is before the first occurrence");
  }
  if (!pattern.days_of_week.empty() && pattern.frequency != model::Frequency::kWeekly) {
    throw util::InvalidRecurrence("days_of_week is only valid for weekly recurrence");
  }
}

Expansion RecurrenceExpander::Expand(const model::TimeRange& base, const model::RecurrencePattern& pattern, const Horizon& horizon) {
  Validate(base, pattern);

  if (pattern.frequency == model::Frequency::kNone) {
    Expansion single;
    single.ranges.push_back(base);
    return single;
  }

  Collector  collector(base, pattern, horizon);
  const auto base_date = std::chrono::floor<days>(base.start());

  switch (pattern.frequency) {
    case model::Frequency::kDaily:
      ExpandDaily(base_date, pattern.interval, collector);
      break;
    case model::Frequency::kWeekly:
      ExpandWeekly(base_date, pattern, collector);
      break;
    case model::Frequency::kMonthly:
      ExpandMonthly(base_date, pattern.interval, collector);
      break;
    case model::Frequency::kNone:
      break;
  }

  return collector.Take();
}

} // namespace roombook::recurrence
