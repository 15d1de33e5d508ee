#pragma once

#include <optional>
#include <vector>

#include "internal/util/time.hpp"

namespace roombook::model {

/*
  Half-open interval [start, end).

  Always well formed: the constructor rejects start >= end with
  util::InvalidRange, so every operation below is total.
*/
class TimeRange {
 public:
  TimeRange(util::TimePoint start, util::TimePoint end);

  util::TimePoint start() const {
    return start_;
  }
  util::TimePoint end() const {
    return end_;
  }
  util::Clock::duration duration() const {
    return end_ - start_;
  }

  bool operator==(const TimeRange& other) const = default;

 private:
  util::TimePoint start_;
  util::TimePoint end_;
};

// Touching endpoints do not overlap.
bool Overlaps(const TimeRange& a, const TimeRange& b);

bool Contains(const TimeRange& outer, const TimeRange& inner);

// Parts of `a` not covered by `b`: zero, one or two ranges, ascending.
std::vector<TimeRange> Subtract(const TimeRange& a, const TimeRange& b);

// Sorts by start and coalesces overlapping or adjacent ranges.
std::vector<TimeRange> MergeSorted(std::vector<TimeRange> ranges);

std::optional<TimeRange> Clip(const TimeRange& range, const TimeRange& window);

bool StartsBefore(const TimeRange& a, const TimeRange& b);

} // namespace roombook::model
