#include "memory_tx.hpp"

#include <stdexcept>
#include <utility>

#include "internal/model/state_machine.hpp"

namespace roombook::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Observe(const std::string& booking_id, std::optional<uint64_t> version) {
  observed_versions_.try_emplace(booking_id, version);
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::runtime_error("transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);
  auto&            state = repo_.committed_;

  for (const auto& [id, observed] : observed_versions_) {
    auto                    it = state.bookings.find(id);
    std::optional<uint64_t> current;
    if (it != state.bookings.end()) current = it->second.version;
    if (current != observed) {
      throw TransactionConflict("transaction conflict: booking " + id + " was modified by a concurrent transaction");
    }
  }

  for (auto& [id, record] : booking_writes_) {
    auto it = state.bookings.find(id);
    if (it != state.bookings.end() && it->second.room_id != record.room_id) {
      state.room_bookings[it->second.room_id].erase(id);
    }

    const bool active = roombook::model::IsActive(static_cast<roombook::model::BookingState>(record.state));
    if (active) {
      state.room_bookings[record.room_id].insert(id);
    } else {
      state.room_bookings[record.room_id].erase(id);
    }
    state.bookings[id] = std::move(record);
  }

  for (auto& [booking_id, occurrences] : occurrence_writes_) {
    state.occurrences[booking_id] = std::move(occurrences);
  }

  committed_ = true;
}

void MemoryTransaction::Rollback() {
  booking_writes_.clear();
  occurrence_writes_.clear();
  rolled_back_ = true;
}

} // namespace roombook::db::memory
