#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace roombook::db {

struct Pagination {
  std::size_t limit  = 100;
  std::size_t offset = 0;
};

/*
  Booking listing filter. Time bounds select bookings whose base range
  starts at or after from_ms and ends at or before to_ms.
*/
struct BookingQuery {
  std::optional<std::string> room_id;
  std::optional<std::string> user_id;
  std::optional<int32_t>     state;
  std::optional<int64_t>     from_ms;
  std::optional<int64_t>     to_ms;
  Pagination                 page;
};

// Half-open [start_ms, end_ms) scan window.
struct TimeWindow {
  int64_t start_ms = 0;
  int64_t end_ms   = 0;
};

} // namespace roombook::db
