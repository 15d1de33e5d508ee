#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/booking_record.hpp"
#include "internal/db/model/occurrence_record.hpp"

namespace roombook::db {

/*
  Repository abstraction (the persistence store collaborator).

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A booking row and its occurrences are written in the same transaction,
    so they commit together or not at all
  - UpdateBooking is version-checked (optimistic concurrency)
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Bookings
  // ---------------------------------------------------------------------

  virtual Result InsertBooking(Transaction&, const model::BookingRecord&) = 0;

  // Fails with Conflict when the stored version differs from expected_version.
  virtual Result UpdateBooking(Transaction&, const model::BookingRecord&, uint64_t expected_version) = 0;

  virtual std::optional<model::BookingRecord> GetBooking(Transaction&, const std::string& id) = 0;

  // Ordered by start, then id.
  virtual std::vector<model::BookingRecord> ListBookings(Transaction&, const BookingQuery& query) = 0;

  // ---------------------------------------------------------------------
  // Occurrences
  // ---------------------------------------------------------------------

  // Replaces the booking's whole occurrence set.
  virtual Result ReplaceOccurrences(Transaction&, const std::string& booking_id, const std::vector<model::OccurrenceRecord>& occurrences) = 0;

  virtual std::vector<model::OccurrenceRecord> GetOccurrences(Transaction&, const std::string& booking_id) = 0;

  // Occurrences of pending/confirmed bookings in one room, ordered by start.
  virtual std::vector<model::OccurrenceRecord> ListActiveOccurrences(Transaction&, const std::string& room_id,
                                                                     const std::optional<TimeWindow>& window) = 0;

  // Rooms that currently hold at least one pending/confirmed booking.
  virtual std::vector<std::string> ListActiveRooms(Transaction&) = 0;
};

} // namespace roombook::db
