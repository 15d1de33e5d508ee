#include "memory_repository.hpp"

#include <algorithm>

#include "internal/model/state_machine.hpp"
#include "memory_tx.hpp"

namespace roombook::db::memory {

namespace {

bool IsActiveRecord(const model::BookingRecord& record) {
  return roombook::model::IsActive(static_cast<roombook::model::BookingState>(record.state));
}

bool Matches(const model::BookingRecord& record, const BookingQuery& query) {
  if (query.room_id && record.room_id != *query.room_id) return false;
  if (query.user_id && record.user_id != *query.user_id) return false;
  if (query.state && record.state != *query.state) return false;
  if (query.from_ms && record.start_ms < *query.from_ms) return false;
  if (query.to_ms && record.end_ms > *query.to_ms) return false;
  return true;
}

bool ByStart(const model::OccurrenceRecord& a, const model::OccurrenceRecord& b) {
  if (a.start_ms != b.start_ms) return a.start_ms < b.start_ms;
  if (a.booking_id != b.booking_id) return a.booking_id < b.booking_id;
  return a.sequence_index < b.sequence_index;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

std::optional<model::BookingRecord> MemoryRepository::ReadBooking(MemoryTransaction& tx, const std::string& id) {
  if (auto it = tx.booking_writes_.find(id); it != tx.booking_writes_.end()) {
    return it->second;
  }

  std::scoped_lock lock(mutex_);
  auto             it = committed_.bookings.find(id);
  if (it == committed_.bookings.end()) return std::nullopt;
  return it->second;
}

std::vector<model::OccurrenceRecord> MemoryRepository::ReadOccurrences(MemoryTransaction& tx, const std::string& booking_id) {
  if (auto it = tx.occurrence_writes_.find(booking_id); it != tx.occurrence_writes_.end()) {
    return it->second;
  }

  std::scoped_lock lock(mutex_);
  auto             it = committed_.occurrences.find(booking_id);
  if (it == committed_.occurrences.end()) return {};
  return it->second;
}

Result MemoryRepository::InsertBooking(Transaction& t, const model::BookingRecord& r) {
  auto& tx = TX(t);
  if (ReadBooking(tx, r.id).has_value()) return Result::Err(ErrorCode::AlreadyExists, "booking " + r.id);
  tx.Observe(r.id, std::nullopt);
  tx.booking_writes_[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateBooking(Transaction& t, const model::BookingRecord& r, uint64_t expected_version) {
  auto& tx      = TX(t);
  auto  current = ReadBooking(tx, r.id);
  if (!current) return Result::Err(ErrorCode::NotFound, "booking " + r.id);
  if (current->version != expected_version) {
    return Result::Err(ErrorCode::Conflict, "booking " + r.id + " is at version " + std::to_string(current->version) + ", expected " +
                                                std::to_string(expected_version));
  }
  if (!tx.booking_writes_.contains(r.id)) {
    tx.Observe(r.id, current->version);
  }
  tx.booking_writes_[r.id] = r;
  return Result::Ok();
}

std::optional<model::BookingRecord> MemoryRepository::GetBooking(Transaction& t, const std::string& id) {
  return ReadBooking(TX(t), id);
}

std::vector<model::BookingRecord> MemoryRepository::ListBookings(Transaction& t, const BookingQuery& query) {
  auto& tx = TX(t);

  std::unordered_map<std::string, model::BookingRecord> merged;
  {
    std::scoped_lock lock(mutex_);
    for (const auto& [id, record] : committed_.bookings) {
      if (Matches(record, query)) merged.emplace(id, record);
    }
  }
  for (const auto& [id, record] : tx.booking_writes_) {
    if (Matches(record, query)) {
      merged[id] = record;
    } else {
      merged.erase(id);
    }
  }

  std::vector<model::BookingRecord> out;
  out.reserve(merged.size());
  for (auto& [_, record] : merged) out.push_back(std::move(record));

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.start_ms != b.start_ms) return a.start_ms < b.start_ms;
    return a.id < b.id;
  });

  if (query.page.offset >= out.size()) return {};
  const auto last = std::min(out.size(), query.page.offset + query.page.limit);
  return {out.begin() + static_cast<std::ptrdiff_t>(query.page.offset), out.begin() + static_cast<std::ptrdiff_t>(last)};
}

Result MemoryRepository::ReplaceOccurrences(Transaction& t, const std::string& booking_id, const std::vector<model::OccurrenceRecord>& occurrences) {
  auto& tx = TX(t);
  if (!ReadBooking(tx, booking_id)) return Result::Err(ErrorCode::NotFound, "booking " + booking_id);
  tx.occurrence_writes_[booking_id] = occurrences;
  return Result::Ok();
}

std::vector<model::OccurrenceRecord> MemoryRepository::GetOccurrences(Transaction& t, const std::string& booking_id) {
  auto out = ReadOccurrences(TX(t), booking_id);
  std::sort(out.begin(), out.end(), ByStart);
  return out;
}

std::vector<model::OccurrenceRecord> MemoryRepository::ListActiveOccurrences(Transaction& t, const std::string& room_id,
                                                                             const std::optional<TimeWindow>& window) {
  auto& tx = TX(t);

  std::set<std::string> booking_ids;
  {
    std::scoped_lock lock(mutex_);
    if (auto it = committed_.room_bookings.find(room_id); it != committed_.room_bookings.end()) {
      booking_ids = it->second;
    }
  }
  for (const auto& [id, record] : tx.booking_writes_) {
    if (record.room_id == room_id && IsActiveRecord(record)) {
      booking_ids.insert(id);
    } else {
      booking_ids.erase(id);
    }
  }

  std::vector<model::OccurrenceRecord> out;
  for (const auto& id : booking_ids) {
    for (auto& occurrence : ReadOccurrences(tx, id)) {
      if (window && (occurrence.end_ms <= window->start_ms || occurrence.start_ms >= window->end_ms)) continue;
      out.push_back(std::move(occurrence));
    }
  }
  std::sort(out.begin(), out.end(), ByStart);
  return out;
}

std::vector<std::string> MemoryRepository::ListActiveRooms(Transaction& t) {
  auto& tx = TX(t);

  std::unordered_map<std::string, std::set<std::string>> room_bookings;
  {
    std::scoped_lock lock(mutex_);
    room_bookings = committed_.room_bookings;
  }
  for (const auto& [id, record] : tx.booking_writes_) {
    for (auto& [_, bookings] : room_bookings) bookings.erase(id);
    if (IsActiveRecord(record)) room_bookings[record.room_id].insert(id);
  }

  std::set<std::string> rooms;
  for (const auto& [room_id, bookings] : room_bookings) {
    if (!bookings.empty()) rooms.insert(room_id);
  }
  return {rooms.begin(), rooms.end()};
}

} // namespace roombook::db::memory
