#pragma once

#include <vector>

#include "internal/db/model/booking_record.hpp"
#include "internal/db/model/occurrence_record.hpp"
#include "internal/model/booking.hpp"

namespace roombook::core {

// Domain <-> persistence row conversion. Occurrences travel separately.
db::model::BookingRecord                ToRecord(const model::Booking& booking);
std::vector<db::model::OccurrenceRecord> ToOccurrenceRecords(const model::Booking& booking);

model::Booking    FromRecord(const db::model::BookingRecord& record, const std::vector<db::model::OccurrenceRecord>& occurrences);
model::Occurrence FromRecord(const db::model::OccurrenceRecord& record);

} // namespace roombook::core
