#pragma once

#include <string>
#include <vector>

#include "internal/model/booking.hpp"

namespace roombook::availability {

/*
  Derived free/busy partition of a query window for one room.

  busy and free are sorted by start, non-overlapping, and together cover
  query_range exactly. Calendar renderers depend on the ordering.
*/
struct AvailabilityWindow {
  std::string                   room_id;
  model::TimeRange              query_range;
  std::vector<model::TimeRange> busy;
  std::vector<model::TimeRange> free;
};

class AvailabilityBuilder {
 public:
  static AvailabilityWindow Build(const std::string& room_id, const model::TimeRange& query, const std::vector<model::Occurrence>& existing);
};

} // namespace roombook::availability
