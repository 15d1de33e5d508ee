#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace roombook::db::memory {

/*
  Transaction = write set over the shared committed state.

  Reads see the write set first, then committed rows. For every booking the
  transaction touches it remembers the version it observed; Commit() fails
  if any of them moved, so disjoint transactions (different rooms) commit
  concurrently while overlapping ones cannot lose an update.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  friend class MemoryRepository;

  // nullopt: booking did not exist when first observed.
  void Observe(const std::string& booking_id, std::optional<uint64_t> version);

  MemoryRepository& repo_;

  std::unordered_map<std::string, model::BookingRecord>                 booking_writes_;
  std::unordered_map<std::string, std::vector<model::OccurrenceRecord>> occurrence_writes_;
  std::unordered_map<std::string, std::optional<uint64_t>>              observed_versions_;

  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace roombook::db::memory
