#pragma once

#include <cstdint>
#include <mutex>
#include <set>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace roombook::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertBooking(Transaction&, const model::BookingRecord&) override;
  Result UpdateBooking(Transaction&, const model::BookingRecord&, uint64_t expected_version) override;
  std::optional<model::BookingRecord> GetBooking(Transaction&, const std::string&) override;
  std::vector<model::BookingRecord> ListBookings(Transaction&, const BookingQuery&) override;

  Result ReplaceOccurrences(Transaction&, const std::string& booking_id, const std::vector<model::OccurrenceRecord>&) override;
  std::vector<model::OccurrenceRecord> GetOccurrences(Transaction&, const std::string& booking_id) override;
  std::vector<model::OccurrenceRecord> ListActiveOccurrences(Transaction&, const std::string& room_id,
                                                             const std::optional<TimeWindow>& window) override;
  std::vector<std::string> ListActiveRooms(Transaction&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::BookingRecord>                 bookings;
    std::unordered_map<std::string, std::vector<model::OccurrenceRecord>> occurrences;
    std::unordered_map<std::string, std::set<std::string>>                room_bookings;
  };

  std::optional<model::BookingRecord> ReadBooking(MemoryTransaction& tx, const std::string& id);
  std::vector<model::OccurrenceRecord> ReadOccurrences(MemoryTransaction& tx, const std::string& booking_id);

  std::mutex mutex_;
  State      committed_;
};

} // namespace roombook::db::memory
