#include "time_range.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace roombook::model {

TimeRange::TimeRange(util::TimePoint start, util::TimePoint end) : start_(start), end_(end) {
  if (!(start_ < end_)) {
    throw util::InvalidRange("time range start must be before end: [" + util::FormatIso8601(start_) + ", " + util::FormatIso8601(end_) + ")");
  }
}

bool Overlaps(const TimeRange& a, const TimeRange& b) {
  return a.start() < b.end() && b.start() < a.end();
}

bool Contains(const TimeRange& outer, const TimeRange& inner) {
  return outer.start() <= inner.start() && inner.end() <= outer.end();
}

std::vector<TimeRange> Subtract(const TimeRange& a, const TimeRange& b) {
  if (!Overlaps(a, b)) {
    return {a};
  }

  std::vector<TimeRange> out;
  if (a.start() < b.start()) {
    out.emplace_back(a.start(), b.start());
  }
  if (b.end() < a.end()) {
    out.emplace_back(b.end(), a.end());
  }
  return out;
}

bool StartsBefore(const TimeRange& a, const TimeRange& b) {
  if (a.start() != b.start()) return a.start() < b.start();
  return a.end() < b.end();
}

std::vector<TimeRange> MergeSorted(std::vector<TimeRange> ranges) {
  std::sort(ranges.begin(), ranges.end(), StartsBefore);

  std::vector<TimeRange> merged;
  merged.reserve(ranges.size());
  for (const auto& range : ranges) {
    if (!merged.empty() && range.start() <= merged.back().end()) {
      if (merged.back().end() < range.end()) {
        merged.back() = TimeRange(merged.back().start(), range.end());
      }
      continue;
    }
    merged.push_back(range);
  }
  return merged;
}

std::optional<TimeRange> Clip(const TimeRange& range, const TimeRange& window) {
  if (!Overlaps(range, window)) {
    return std::nullopt;
  }
  return TimeRange(std::max(range.start(), window.start()), std::min(range.end(), window.end()));
}

} // namespace roombook::model
