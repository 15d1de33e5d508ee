#include "booking_mapper.hpp"

#include <utility>

#include "internal/util/time.hpp"

namespace roombook::core {

using util::FromUnixMillis;
using util::ToUnixMillis;

db::model::BookingRecord ToRecord(const model::Booking& booking) {
  db::model::BookingRecord record;
  record.id          = booking.id;
  record.room_id     = booking.room_id;
  record.user_id     = booking.user_id;
  record.title       = booking.title;
  record.description = booking.description;
  record.attendees   = booking.attendees;
  record.start_ms    = ToUnixMillis(booking.range.start());
  record.end_ms      = ToUnixMillis(booking.range.end());

  if (booking.recurrence) {
    const auto& pattern         = *booking.recurrence;
    record.has_recurrence       = true;
    record.recurrence_frequency = static_cast<int32_t>(pattern.frequency);
    record.recurrence_interval  = pattern.interval;
    if (pattern.end_date) record.recurrence_end_ms = ToUnixMillis(*pattern.end_date);
    record.recurrence_days = model::FormatWeekdays(pattern.days_of_week);
    if (pattern.count) record.recurrence_count = *pattern.count;
  }

  record.state               = static_cast<int32_t>(booking.state);
  record.version             = booking.version;
  record.cancellation_reason = booking.cancellation_reason;
  record.cancelled_by        = booking.cancelled_by;
  if (booking.cancelled_at) record.cancelled_at_ms = ToUnixMillis(*booking.cancelled_at);
  record.created_at_ms = ToUnixMillis(booking.created_at);
  record.updated_at_ms = ToUnixMillis(booking.updated_at);
  return record;
}

std::vector<db::model::OccurrenceRecord> ToOccurrenceRecords(const model::Booking& booking) {
  std::vector<db::model::OccurrenceRecord> records;
  records.reserve(booking.occurrences.size());
  for (const auto& occurrence : booking.occurrences) {
    records.push_back(db::model::OccurrenceRecord{.booking_id     = occurrence.booking_id,
                                                  .room_id        = booking.room_id,
                                                  .sequence_index = occurrence.sequence_index,
                                                  .start_ms       = ToUnixMillis(occurrence.range.start()),
                                                  .end_ms         = ToUnixMillis(occurrence.range.end())});
  }
  return records;
}

model::Occurrence FromRecord(const db::model::OccurrenceRecord& record) {
  return model::Occurrence{.booking_id     = record.booking_id,
                           .range          = model::TimeRange(FromUnixMillis(record.start_ms), FromUnixMillis(record.end_ms)),
                           .sequence_index = record.sequence_index};
}

model::Booking FromRecord(const db::model::BookingRecord& record, const std::vector<db::model::OccurrenceRecord>& occurrences) {
  model::Booking booking{.id          = record.id,
                         .room_id     = record.room_id,
                         .user_id     = record.user_id,
                         .title       = record.title,
                         .description = record.description,
                         .attendees   = record.attendees,
                         .range       = model::TimeRange(FromUnixMillis(record.start_ms), FromUnixMillis(record.end_ms))};

  if (record.has_recurrence) {
    model::RecurrencePattern pattern;
    pattern.frequency = static_cast<model::Frequency>(record.recurrence_frequency);
    pattern.interval  = record.recurrence_interval;
    if (record.recurrence_end_ms) pattern.end_date = FromUnixMillis(*record.recurrence_end_ms);
    pattern.days_of_week = model::ParseWeekdays(record.recurrence_days);
    if (record.recurrence_count) pattern.count = *record.recurrence_count;
    booking.recurrence = std::move(pattern);
  }

  booking.state   = static_cast<model::BookingState>(record.state);
  booking.version = record.version;

  booking.occurrences.reserve(occurrences.size());
  for (const auto& occurrence : occurrences) {
    booking.occurrences.push_back(FromRecord(occurrence));
  }

  booking.cancellation_reason = record.cancellation_reason;
  booking.cancelled_by        = record.cancelled_by;
  if (record.cancelled_at_ms) booking.cancelled_at = FromUnixMillis(*record.cancelled_at_ms);
  booking.created_at = FromUnixMillis(record.created_at_ms);
  booking.updated_at = FromUnixMillis(record.updated_at_ms);
  return booking;
}

} // namespace roombook::core
