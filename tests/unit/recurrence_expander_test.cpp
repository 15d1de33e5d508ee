#include "internal/recurrence/recurrence_expander.hpp"

#include <cassert>
#include <chrono>
#include <climits>
#include <cstddef>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using roombook::model::Frequency;
using roombook::model::RecurrencePattern;
using roombook::model::TimeRange;
using roombook::model::Weekday;
using roombook::recurrence::Horizon;
using roombook::recurrence::RecurrenceExpander;
using roombook::util::FormatIso8601;
using roombook::util::ParseIso8601;

TimeRange At(const char* start, const char* end) {
  return TimeRange(ParseIso8601(start), ParseIso8601(end));
}

std::vector<std::string> Starts(const std::vector<TimeRange>& ranges) {
  std::vector<std::string> out;
  for (const auto& r : ranges) out.push_back(FormatIso8601(r.start()));
  return out;
}

bool ThrowsInvalidRecurrence(const TimeRange& base, const RecurrencePattern& pattern) {
  try {
    RecurrenceExpander::Expand(base, pattern, Horizon{});
  } catch (const roombook::util::InvalidRecurrence&) {
    return true;
  }
  return false;
}

void TestWeeklyMondayWednesdayCountFour() {
  const auto base = At("2025-01-06T09:00Z", "2025-01-06T10:00Z"); // Monday

  RecurrencePattern pattern;
  pattern.frequency    = Frequency::kWeekly;
  pattern.days_of_week = {Weekday::kMonday, Weekday::kWednesday};
  pattern.count        = 4;

  auto expansion = RecurrenceExpander::Expand(base, pattern, Horizon{});
  assert(!expansion.truncated);
  assert((Starts(expansion.ranges) == std::vector<std::string>{"2025-01-06T09:00:00Z", "2025-01-08T09:00:00Z", "2025-01-13T09:00:00Z",
                                                                "2025-01-15T09:00:00Z"}));
  for (const auto& r : expansion.ranges) {
    assert(r.duration() == std::chrono::hours(1));
  }
}

void TestWeeklyEmptyDaysDefaultsToBaseWeekdayAndHonorsInterval() {
  const auto base = At("2025-01-08T14:00Z", "2025-01-08T15:00Z"); // Wednesday

  RecurrencePattern pattern;
  pattern.frequency = Frequency::kWeekly;
  pattern.interval  = 2;
  pattern.count     = 3;

  auto expansion = RecurrenceExpander::Expand(base, pattern, Horizon{});
  assert((Starts(expansion.ranges) == std::vector<std::string>{"2025-01-08T14:00:00Z", "2025-01-22T14:00:00Z", "2025-02-05T14:00:00Z"}));
}

void TestWeeklySkipsSelectedDaysBeforeBase() {
  const auto base = At("2025-01-08T09:00Z", "2025-01-08T10:00Z"); // Wednesday

  RecurrencePattern pattern;
  pattern.frequency    = Frequency::kWeekly;
  pattern.days_of_week = {Weekday::kMonday, Weekday::kWednesday};
  pattern.count        = 3;

  auto expansion = RecurrenceExpander::Expand(base, pattern, Horizon{});
  assert((Starts(expansion.ranges) == std::vector<std::string>{"2025-01-08T09:00:00Z", "2025-01-13T09:00:00Z", "2025-01-15T09:00:00Z"}));
}

void TestDailyEndDateIsInclusive() {
  const auto base = At("2025-03-01T08:00Z", "2025-03-01T08:30Z");

  RecurrencePattern pattern;
  pattern.frequency = Frequency::kDaily;
  pattern.end_date  = ParseIso8601("2025-03-04T08:00Z");

  auto expansion = RecurrenceExpander::Expand(base, pattern, Horizon{});
  assert(expansion.ranges.size() == 4);
  assert(FormatIso8601(expansion.ranges.back().start()) == "2025-03-04T08:00:00Z");
}

void TestMonthlySkipsMonthsWithoutTheDay() {
  const auto base = At("2025-01-31T09:00Z", "2025-01-31T10:00Z");

  RecurrencePattern pattern;
  pattern.frequency = Frequency::kMonthly;
  pattern.count     = 4;

  // Feb, Apr and Jun have no 31st: skipped, never rolled to the month end,
  // and they do not consume the count.
  auto expansion = RecurrenceExpander::Expand(base, pattern, Horizon{});
  assert((Starts(expansion.ranges) == std::vector<std::string>{"2025-01-31T09:00:00Z", "2025-03-31T09:00:00Z", "2025-05-31T09:00:00Z",
                                                                "2025-07-31T09:00:00Z"}));
}

void TestMonthlyLeapDay() {
  const auto base = At("2024-02-29T09:00Z", "2024-02-29T10:00Z");

  RecurrencePattern pattern;
  pattern.frequency = Frequency::kMonthly;
  pattern.interval  = 12;
  pattern.count     = 2;

  auto expansion = RecurrenceExpander::Expand(base, pattern, Horizon{});
  assert((Starts(expansion.ranges) == std::vector<std::string>{"2024-02-29T09:00:00Z", "2028-02-29T09:00:00Z"}));
}

void TestHorizonTruncatesInsteadOfFailing() {
  const auto base = At("2025-01-01T09:00Z", "2025-01-01T10:00Z");

  RecurrencePattern pattern;
  pattern.frequency = Frequency::kDaily;
  pattern.count     = 1000;

  auto capped = RecurrenceExpander::Expand(base, pattern, Horizon{.max_occurrences = 10, .latest_start = std::nullopt});
  assert(capped.ranges.size() == 10);
  assert(capped.truncated);

  auto bounded = RecurrenceExpander::Expand(base, pattern, Horizon{.max_occurrences = 500, .latest_start = ParseIso8601("2025-01-05T09:00Z")});
  assert(bounded.ranges.size() == 5);
  assert(bounded.truncated);
}

void TestExpansionIsDeterministic() {
  const auto base = At("2025-01-06T09:00Z", "2025-01-06T10:00Z");

  RecurrencePattern pattern;
  pattern.frequency    = Frequency::kWeekly;
  pattern.days_of_week = {Weekday::kTuesday, Weekday::kFriday};
  pattern.end_date     = ParseIso8601("2025-03-01T00:00Z");

  auto first  = RecurrenceExpander::Expand(base, pattern, Horizon{});
  auto second = RecurrenceExpander::Expand(base, pattern, Horizon{});
  assert(first.ranges == second.ranges);
  assert(!first.ranges.empty());
}

void TestNoneYieldsBase() {
  const auto base = At("2025-01-06T09:00Z", "2025-01-06T10:00Z");
  auto       expansion = RecurrenceExpander::Expand(base, RecurrencePattern{}, Horizon{});
  assert(expansion.ranges.size() == 1);
  assert(expansion.ranges.front() == base);
}

void TestMalformedPatternsAreRejected() {
  const auto base = At("2025-01-06T09:00Z", "2025-01-06T10:00Z");

  RecurrencePattern unbounded;
  unbounded.frequency = Frequency::kDaily;
  assert(ThrowsInvalidRecurrence(base, unbounded));

  RecurrencePattern both = unbounded;
  both.count             = 3;
  both.end_date          = ParseIso8601("2025-02-01T00:00Z");
  assert(ThrowsInvalidRecurrence(base, both));

  RecurrencePattern zero_interval = unbounded;
  zero_interval.count             = 3;
  zero_interval.interval          = 0;
  assert(ThrowsInvalidRecurrence(base, zero_interval));

  RecurrencePattern ends_before = unbounded;
  ends_before.end_date          = ParseIso8601("2025-01-01T00:00Z");
  assert(ThrowsInvalidRecurrence(base, ends_before));

  RecurrencePattern days_on_daily = unbounded;
  days_on_daily.count             = 2;
  days_on_daily.days_of_week      = {Weekday::kMonday};
  assert(ThrowsInvalidRecurrence(base, days_on_daily));
}

void TestOversizedIntervalsAreRejected() {
  const auto base = At("2030-01-07T09:00Z", "2030-01-07T10:00Z");

  for (auto frequency : {Frequency::kDaily, Frequency::kWeekly, Frequency::kMonthly}) {
    RecurrencePattern pattern;
    pattern.frequency = frequency;
    pattern.count     = 3;

    pattern.interval = RecurrenceExpander::MaxInterval(frequency) + 1;
    assert(ThrowsInvalidRecurrence(base, pattern));

    pattern.interval = 200000;
    assert(ThrowsInvalidRecurrence(base, pattern));

    pattern.interval = 400000000;
    assert(ThrowsInvalidRecurrence(base, pattern));

    pattern.interval = INT_MAX;
    assert(ThrowsInvalidRecurrence(base, pattern));
  }
}

void TestWidestIntervalsStayOrderedAndBounded() {
  const auto base = At("2030-01-07T09:00Z", "2030-01-07T10:00Z");

  for (auto frequency : {Frequency::kDaily, Frequency::kWeekly, Frequency::kMonthly}) {
    RecurrencePattern pattern;
    pattern.frequency = frequency;
    pattern.interval  = RecurrenceExpander::MaxInterval(frequency);
    pattern.count     = 3;

    auto open = RecurrenceExpander::Expand(base, pattern, Horizon{});
    assert(open.ranges.size() == 3);
    assert(!open.truncated);
    assert(open.ranges.front() == base);
    for (std::size_t i = 1; i < open.ranges.size(); ++i) {
      assert(open.ranges[i - 1].start() < open.ranges[i].start());
    }

    // Two years of horizon only fit the base occurrence.
    auto bounded = RecurrenceExpander::Expand(base, pattern, Horizon{.max_occurrences = 500, .latest_start = base.start() + std::chrono::days{730}});
    assert(bounded.ranges.size() == 1);
    assert(bounded.ranges.front() == base);
    assert(bounded.truncated);
  }

  RecurrencePattern monthly;
  monthly.frequency = Frequency::kMonthly;
  monthly.interval  = RecurrenceExpander::kMaxMonthlyInterval;
  monthly.count     = 3;
  assert((Starts(RecurrenceExpander::Expand(base, monthly, Horizon{}).ranges) ==
          std::vector<std::string>{"2030-01-07T09:00:00Z", "2040-01-07T09:00:00Z", "2050-01-07T09:00:00Z"}));
}

void TestSeriesStopsAtTheEndOfTheClockRange() {
  const auto base = At("2261-06-01T09:00Z", "2261-06-01T10:00Z");

  const std::vector<std::pair<Frequency, int>> yearly = {{Frequency::kDaily, 365}, {Frequency::kWeekly, 52}, {Frequency::kMonthly, 12}};
  for (const auto& [frequency, interval] : yearly) {
    RecurrencePattern pattern;
    pattern.frequency = frequency;
    pattern.interval  = interval;
    pattern.count     = 5;

    auto expansion = RecurrenceExpander::Expand(base, pattern, Horizon{});
    assert(expansion.ranges.size() == 1);
    assert(expansion.ranges.front() == base);
    assert(expansion.truncated);
  }

  // The series' own end date still wins over the clock limit.
  RecurrencePattern until;
  until.frequency = Frequency::kMonthly;
  until.interval  = 12;
  until.end_date  = ParseIso8601("2261-12-31T00:00Z");

  auto expansion = RecurrenceExpander::Expand(base, until, Horizon{});
  assert(expansion.ranges.size() == 1);
  assert(!expansion.truncated);
}

} // namespace

int main() {
  TestWeeklyMondayWednesdayCountFour();
  TestWeeklyEmptyDaysDefaultsToBaseWeekdayAndHonorsInterval();
  TestWeeklySkipsSelectedDaysBeforeBase();
  TestDailyEndDateIsInclusive();
  TestMonthlySkipsMonthsWithoutTheDay();
  TestMonthlyLeapDay();
  TestHorizonTruncatesInsteadOfFailing();
  TestExpansionIsDeterministic();
  TestNoneYieldsBase();
  TestMalformedPatternsAreRejected();
  TestOversizedIntervalsAreRejected();
  TestWidestIntervalsStayOrderedAndBounded();
  TestSeriesStopsAtTheEndOfTheClockRange();

  std::cout << "roombook_unit_recurrence_expander: pass\n";
  return 0;
}
