#pragma once

#include <cstdint>
#include <string>

namespace roombook::db::model {

/*
  One materialized occurrence. room_id is denormalized from the owning
  booking so per-room range scans need no join on the hot path.
*/
struct OccurrenceRecord {
  std::string booking_id;
  std::string room_id;
  uint32_t    sequence_index = 0;
  int64_t     start_ms       = 0;
  int64_t     end_ms         = 0;
};

} // namespace roombook::db::model
