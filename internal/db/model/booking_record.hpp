#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace roombook::db::model {

/*
  Persistent booking row.

  IMPORTANT:
  - This is the authoritative lifecycle record.
  - version is used for optimistic concurrency: updates carry the version
    they were derived from and fail with ErrorCode::Conflict on mismatch.
  - Instants are Unix milliseconds (UTC).
*/
struct BookingRecord {
  std::string id;
  std::string room_id;
  std::string user_id;

  std::string                  title;
  std::string                  description;
  std::optional<std::uint32_t> attendees;

  int64_t start_ms = 0;
  int64_t end_ms   = 0;

  // Recurrence columns; frequency 0 with has_recurrence=false means one-off.
  bool                   has_recurrence       = false;
  int32_t                recurrence_frequency = 0;
  int32_t                recurrence_interval  = 1;
  std::optional<int64_t> recurrence_end_ms;
  std::string            recurrence_days; // "mon,wed"
  std::optional<int32_t> recurrence_count;

  int32_t  state   = 0;
  uint64_t version = 0;

  std::string            cancellation_reason;
  std::string            cancelled_by;
  std::optional<int64_t> cancelled_at_ms;

  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;
};

} // namespace roombook::db::model
