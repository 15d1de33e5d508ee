#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace roombook::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
  static Result             Execute(sqlite3* db, const char* sql, const sql::Params& params);
};

} // namespace roombook::db::sqlite
