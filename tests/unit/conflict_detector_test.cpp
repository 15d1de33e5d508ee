#include "internal/conflict/conflict_detector.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace {

using roombook::conflict::ConflictDetector;
using roombook::model::Occurrence;
using roombook::model::TimeRange;
using roombook::util::ParseIso8601;

Occurrence Occ(const std::string& booking, const char* start, const char* end, std::uint32_t seq = 0) {
  return Occurrence{.booking_id = booking, .range = TimeRange(ParseIso8601(start), ParseIso8601(end)), .sequence_index = seq};
}

// Reference O(n*m) answer used to cross-check the sweep.
std::size_t NaiveCount(const std::vector<Occurrence>& candidates, const std::vector<Occurrence>& existing) {
  std::size_t n = 0;
  for (const auto& c : candidates) {
    for (const auto& e : existing) {
      if (c.booking_id != e.booking_id && Overlaps(c.range, e.range)) ++n;
    }
  }
  return n;
}

void TestSingleOverlapNamesExistingBooking() {
  std::vector<Occurrence> existing{Occ("first", "2025-01-06T10:00Z", "2025-01-06T11:00Z")};

  auto clean = ConflictDetector::FindConflicts({Occ("new", "2025-01-06T12:00Z", "2025-01-06T13:00Z")}, existing);
  assert(ConflictDetector::Admissible(clean));

  auto conflicts = ConflictDetector::FindConflicts({Occ("new", "2025-01-06T10:30Z", "2025-01-06T10:45Z")}, existing);
  assert(conflicts.size() == 1);
  assert(conflicts[0].existing.booking_id == "first");
  assert(conflicts[0].candidate.booking_id == "new");
}

void TestTouchingEndpointsAreAdmissible() {
  std::vector<Occurrence> existing{Occ("a", "2025-01-06T10:00Z", "2025-01-06T11:00Z")};
  auto conflicts = ConflictDetector::FindConflicts(
      {Occ("b", "2025-01-06T09:00Z", "2025-01-06T10:00Z"), Occ("b", "2025-01-06T11:00Z", "2025-01-06T12:00Z", 1)}, existing);
  assert(conflicts.empty());
}

void TestSelfExcludedByIdentityNotValue() {
  // A no-op reschedule produces ranges identical to its own prior occurrences.
  std::vector<Occurrence> existing{Occ("same", "2025-01-06T10:00Z", "2025-01-06T11:00Z"),
                                   Occ("other", "2025-01-06T10:00Z", "2025-01-06T11:00Z")};
  auto conflicts = ConflictDetector::FindConflicts({Occ("same", "2025-01-06T10:00Z", "2025-01-06T11:00Z")}, existing);
  assert(conflicts.size() == 1);
  assert(conflicts[0].existing.booking_id == "other");
}

void TestLongExistingOccurrenceSpansSeveralCandidates() {
  std::vector<Occurrence> existing{Occ("allday", "2025-01-06T08:00Z", "2025-01-06T18:00Z"),
                                   Occ("late", "2025-01-06T17:00Z", "2025-01-06T19:00Z")};
  std::vector<Occurrence> candidates{Occ("c", "2025-01-06T16:30Z", "2025-01-06T17:30Z", 2), Occ("c", "2025-01-06T09:00Z", "2025-01-06T10:00Z", 0),
                                     Occ("c", "2025-01-06T12:00Z", "2025-01-06T13:00Z", 1)};

  auto conflicts = ConflictDetector::FindConflicts(candidates, existing);
  assert(conflicts.size() == NaiveCount(candidates, existing));
  assert(conflicts.size() == 4);

  // ordered by candidate start, then existing start
  assert(conflicts[0].candidate.sequence_index == 0);
  assert(conflicts[1].candidate.sequence_index == 1);
  assert(conflicts[2].candidate.sequence_index == 2 && conflicts[2].existing.booking_id == "allday");
  assert(conflicts[3].candidate.sequence_index == 2 && conflicts[3].existing.booking_id == "late");
}

void TestSweepMatchesNaiveOnDenseSeries() {
  std::vector<Occurrence> existing;
  std::vector<Occurrence> candidates;
  const auto              day = ParseIso8601("2025-01-06T00:00Z");
  for (int i = 0; i < 40; ++i) {
    const auto s = day + std::chrono::minutes(45 * i);
    existing.push_back(Occurrence{"e" + std::to_string(i % 5), TimeRange(s, s + std::chrono::minutes(50)), static_cast<std::uint32_t>(i)});
    const auto c = day + std::chrono::minutes(70 * i + 10);
    candidates.push_back(Occurrence{"cand", TimeRange(c, c + std::chrono::minutes(30)), static_cast<std::uint32_t>(i)});
  }

  auto conflicts = ConflictDetector::FindConflicts(candidates, existing);
  assert(conflicts.size() == NaiveCount(candidates, existing));
  for (const auto& c : conflicts) {
    assert(Overlaps(c.candidate.range, c.existing.range));
  }
}

void TestFindOverlapsWithinSkipsSameBooking() {
  std::vector<Occurrence> occurrences{Occ("a", "2025-01-06T10:00Z", "2025-01-06T11:00Z"), Occ("a", "2025-01-06T10:30Z", "2025-01-06T11:30Z", 1),
                                      Occ("b", "2025-01-06T10:45Z", "2025-01-06T12:00Z"), Occ("c", "2025-01-06T12:00Z", "2025-01-06T13:00Z")};

  auto overlaps = ConflictDetector::FindOverlapsWithin(occurrences);
  assert(overlaps.size() == 2);
  for (const auto& o : overlaps) {
    assert(o.candidate.booking_id == "a");
    assert(o.existing.booking_id == "b");
  }
}

} // namespace

int main() {
  TestSingleOverlapNamesExistingBooking();
  TestTouchingEndpointsAreAdmissible();
  TestSelfExcludedByIdentityNotValue();
  TestLongExistingOccurrenceSpansSeveralCandidates();
  TestSweepMatchesNaiveOnDenseSeries();
  TestFindOverlapsWithinSkipsSameBooking();

  std::cout << "roombook_unit_conflict_detector: pass\n";
  return 0;
}
