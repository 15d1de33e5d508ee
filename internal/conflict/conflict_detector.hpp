#pragma once

#include <vector>

#include "internal/model/booking.hpp"

namespace roombook::conflict {

struct Conflict {
  model::Occurrence candidate;
  model::Occurrence existing;
};

/*
  Sweep-based overlap detection.

  Both inputs are sorted by start, then a single pass keeps a window of
  existing occurrences that can still overlap the current candidate. Each
  existing occurrence enters and leaves the window once, so the cost is
  O(n log n + m log m + pairs) instead of n*m.

  Pairs that share a booking id are never reported: a booking being
  rescheduled is compared by identity against its own prior occurrences,
  even when a no-op edit produces identical ranges.

  The caller decides what "existing" means (active bookings of one room).
*/
class ConflictDetector {
 public:
  // Ordered by candidate start, then existing start.
  static std::vector<Conflict> FindConflicts(std::vector<model::Occurrence> candidates, std::vector<model::Occurrence> existing);

  static bool Admissible(const std::vector<Conflict>& conflicts) {
    return conflicts.empty();
  }

  // Every overlapping pair of distinct bookings within one set; used by audits.
  static std::vector<Conflict> FindOverlapsWithin(std::vector<model::Occurrence> occurrences);
};

} // namespace roombook::conflict
