#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "internal/db/sql/sql_queries.hpp"

namespace roombook::db::sqlite {

using roombook::db::ErrorCode;
using roombook::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st);
}

void Bind(sqlite3_stmt* st, const sql::Params& params) {
  int idx = 1;
  for (const auto& param : params) {
    std::visit(
        [&](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(st, idx);
          } else if constexpr (std::is_same_v<T, int32_t>) {
            sqlite3_bind_int(st, idx, v);
          } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(st, idx, v.c_str(), -1, SQLITE_TRANSIENT);
          } else {
            sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
          }
        },
        param);
    ++idx;
  }
}

template <typename T>
sql::Param Nullable(const std::optional<T>& v) {
  if (!v) return nullptr;
  return *v;
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_int64(st, col);
}

sql::Params BookingParams(const model::BookingRecord& r) {
  sql::Params p;
  p.reserve(21);
  p.emplace_back(r.id);
  p.emplace_back(r.room_id);
  p.emplace_back(r.user_id);
  p.emplace_back(r.title);
  p.emplace_back(r.description);
  p.push_back(r.attendees ? sql::Param(static_cast<int64_t>(*r.attendees)) : sql::Param(nullptr));
  p.emplace_back(r.start_ms);
  p.emplace_back(r.end_ms);
  p.emplace_back(static_cast<int32_t>(r.has_recurrence ? 1 : 0));
  p.emplace_back(r.recurrence_frequency);
  p.emplace_back(r.recurrence_interval);
  p.push_back(Nullable(r.recurrence_end_ms));
  p.emplace_back(r.recurrence_days);
  p.push_back(Nullable(r.recurrence_count));
  p.emplace_back(r.state);
  p.emplace_back(r.version);
  p.emplace_back(r.cancellation_reason);
  p.emplace_back(r.cancelled_by);
  p.push_back(Nullable(r.cancelled_at_ms));
  p.emplace_back(r.created_at_ms);
  p.emplace_back(r.updated_at_ms);
  return p;
}

// Column order of ROOMBOOK_BOOKING_COLUMNS.
model::BookingRecord ReadBooking(sqlite3_stmt* st) {
  model::BookingRecord r;
  r.id          = ColText(st, 0);
  r.room_id     = ColText(st, 1);
  r.user_id     = ColText(st, 2);
  r.title       = ColText(st, 3);
  r.description = ColText(st, 4);
  if (auto attendees = ColOptI64(st, 5)) r.attendees = static_cast<uint32_t>(*attendees);
  r.start_ms             = sqlite3_column_int64(st, 6);
  r.end_ms               = sqlite3_column_int64(st, 7);
  r.has_recurrence       = sqlite3_column_int(st, 8) != 0;
  r.recurrence_frequency = sqlite3_column_int(st, 9);
  r.recurrence_interval  = sqlite3_column_int(st, 10);
  r.recurrence_end_ms    = ColOptI64(st, 11);
  r.recurrence_days      = ColText(st, 12);
  if (auto count = ColOptI64(st, 13)) r.recurrence_count = static_cast<int32_t>(*count);
  r.state               = sqlite3_column_int(st, 14);
  r.version             = static_cast<uint64_t>(sqlite3_column_int64(st, 15));
  r.cancellation_reason = ColText(st, 16);
  r.cancelled_by        = ColText(st, 17);
  r.cancelled_at_ms     = ColOptI64(st, 18);
  r.created_at_ms       = sqlite3_column_int64(st, 19);
  r.updated_at_ms       = sqlite3_column_int64(st, 20);
  return r;
}

model::OccurrenceRecord ReadOccurrence(sqlite3_stmt* st) {
  model::OccurrenceRecord r;
  r.booking_id     = ColText(st, 0);
  r.room_id        = ColText(st, 1);
  r.sequence_index = static_cast<uint32_t>(sqlite3_column_int64(st, 2));
  r.start_ms       = sqlite3_column_int64(st, 3);
  r.end_ms         = sqlite3_column_int64(st, 4);
  return r;
}

template <typename Reader>
auto Query(sqlite3* db, const char* sql, const sql::Params& params, Reader reader) {
  auto st = Prepare(db, sql);
  Bind(st.get(), params);

  std::vector<decltype(reader(st.get()))> out;
  int                                     rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(reader(st.get()));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteRepository::Execute(sqlite3* db, const char* sql, const sql::Params& params) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Stmt st(raw);
  Bind(st.get(), params);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Bookings
// ------------------------------------------------------------------

Result SqliteRepository::InsertBooking(Transaction& t, const model::BookingRecord& r) {
  return Execute(TX(t).Handle(), sql::INSERT_BOOKING, BookingParams(r));
}

Result SqliteRepository::UpdateBooking(Transaction& t, const model::BookingRecord& r, uint64_t expected_version) {
  auto* db = TX(t).Handle();

  auto params = BookingParams(r);
  params.emplace_back(r.id);
  params.emplace_back(expected_version);

  auto result = Execute(db, sql::UPDATE_BOOKING, params);
  if (!result) return result;
  if (sqlite3_changes(db) > 0) return Result::Ok();

  auto versions = Query(db, sql::SELECT_BOOKING_VERSION, {r.id}, [](sqlite3_stmt* st) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, 0));
  });
  if (versions.empty()) return Result::Err(ErrorCode::NotFound, "booking " + r.id);
  return Result::Err(ErrorCode::Conflict, "booking " + r.id + " is at version " + std::to_string(versions.front()) + ", expected " +
                                              std::to_string(expected_version));
}

std::optional<model::BookingRecord> SqliteRepository::GetBooking(Transaction& t, const std::string& id) {
  auto rows = Query(TX(t).Handle(), sql::SELECT_BOOKING, {id}, ReadBooking);
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

std::vector<model::BookingRecord> SqliteRepository::ListBookings(Transaction& t, const BookingQuery& q) {
  sql::Params params{Nullable(q.room_id),
                     Nullable(q.user_id),
                     Nullable(q.state),
                     Nullable(q.from_ms),
                     Nullable(q.to_ms),
                     static_cast<int64_t>(q.page.limit),
                     static_cast<int64_t>(q.page.offset)};
  return Query(TX(t).Handle(), sql::LIST_BOOKINGS, params, ReadBooking);
}

// ------------------------------------------------------------------
// Occurrences
// ------------------------------------------------------------------

Result SqliteRepository::ReplaceOccurrences(Transaction& t, const std::string& booking_id, const std::vector<model::OccurrenceRecord>& occurrences) {
  auto* db = TX(t).Handle();

  auto owner = Query(db, sql::SELECT_BOOKING_VERSION, {booking_id}, [](sqlite3_stmt* st) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, 0));
  });
  if (owner.empty()) return Result::Err(ErrorCode::NotFound, "booking " + booking_id);

  auto result = Execute(db, sql::DELETE_OCCURRENCES, {booking_id});
  if (!result) return result;

  for (const auto& o : occurrences) {
    result = Execute(db, sql::INSERT_OCCURRENCE,
                     {booking_id, o.room_id, static_cast<int64_t>(o.sequence_index), o.start_ms, o.end_ms});
    if (!result) return result;
  }
  return Result::Ok();
}

std::vector<model::OccurrenceRecord> SqliteRepository::GetOccurrences(Transaction& t, const std::string& booking_id) {
  return Query(TX(t).Handle(), sql::SELECT_OCCURRENCES, {booking_id}, ReadOccurrence);
}

std::vector<model::OccurrenceRecord> SqliteRepository::ListActiveOccurrences(Transaction& t, const std::string& room_id,
                                                                             const std::optional<TimeWindow>& window) {
  sql::Params params{room_id, nullptr, nullptr};
  if (window) {
    params[1] = window->start_ms;
    params[2] = window->end_ms;
  }
  return Query(TX(t).Handle(), sql::SELECT_ACTIVE_OCCURRENCES, params, ReadOccurrence);
}

std::vector<std::string> SqliteRepository::ListActiveRooms(Transaction& t) {
  return Query(TX(t).Handle(), sql::SELECT_ACTIVE_ROOMS, {}, [](sqlite3_stmt* st) {
    return ColText(st, 0);
  });
}

} // namespace roombook::db::sqlite
