#include "conflict_detector.hpp"

#include <algorithm>

namespace roombook::conflict {

namespace {

bool ByStart(const model::Occurrence& a, const model::Occurrence& b) {
  if (a.range.start() != b.range.start()) return a.range.start() < b.range.start();
  if (a.range.end() != b.range.end()) return a.range.end() < b.range.end();
  if (a.booking_id != b.booking_id) return a.booking_id < b.booking_id;
  return a.sequence_index < b.sequence_index;
}

} // namespace

std::vector<Conflict> ConflictDetector::FindConflicts(std::vector<model::Occurrence> candidates, std::vector<model::Occurrence> existing) {
  std::sort(candidates.begin(), candidates.end(), ByStart);
  std::sort(existing.begin(), existing.end(), ByStart);

  std::vector<Conflict>                  conflicts;
  std::vector<const model::Occurrence*> window;
  std::size_t                            next = 0;

  for (const auto& candidate : candidates) {
    // Candidates arrive by ascending start, so anything ending at or before
    // this start can never overlap a later candidate either.
    std::erase_if(window, [&](const model::Occurrence* e) { return e->range.end() <= candidate.range.start(); });

    while (next < existing.size() && existing[next].range.start() < candidate.range.end()) {
      if (existing[next].range.end() > candidate.range.start()) {
        window.push_back(&existing[next]);
      }
      ++next;
    }

    for (const auto* e : window) {
      if (e->booking_id == candidate.booking_id) continue;
      if (!model::Overlaps(candidate.range, e->range)) continue;
      conflicts.push_back({candidate, *e});
    }
  }

  return conflicts;
}

std::vector<Conflict> ConflictDetector::FindOverlapsWithin(std::vector<model::Occurrence> occurrences) {
  std::sort(occurrences.begin(), occurrences.end(), ByStart);

  std::vector<Conflict> overlaps;
  for (std::size_t i = 0; i < occurrences.size(); ++i) {
    for (std::size_t j = i + 1; j < occurrences.size(); ++j) {
      if (occurrences[j].range.start() >= occurrences[i].range.end()) break;
      if (occurrences[i].booking_id == occurrences[j].booking_id) continue;
      overlaps.push_back({occurrences[i], occurrences[j]});
    }
  }
  return overlaps;
}

} // namespace roombook::conflict
