#include "availability_builder.hpp"

#include <utility>

namespace roombook::availability {

AvailabilityWindow AvailabilityBuilder::Build(const std::string& room_id, const model::TimeRange& query,
                                              const std::vector<model::Occurrence>& existing) {
  std::vector<model::TimeRange> clipped;
  clipped.reserve(existing.size());
  for (const auto& occurrence : existing) {
    if (auto part = model::Clip(occurrence.range, query)) {
      clipped.push_back(*part);
    }
  }

  AvailabilityWindow window{room_id, query, model::MergeSorted(std::move(clipped)), {}};

  // busy is sorted and disjoint, so only the trailing free piece can still
  // intersect the next busy range.
  window.free.push_back(query);
  for (const auto& busy : window.busy) {
    const auto tail = window.free.back();
    window.free.pop_back();
    for (auto& piece : model::Subtract(tail, busy)) {
      window.free.push_back(piece);
    }
    if (window.free.empty()) break;
  }

  return window;
}

} // namespace roombook::availability
