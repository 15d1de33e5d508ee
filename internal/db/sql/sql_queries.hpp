#pragma once

namespace roombook::db::sql {

/*
  Canonical SQL for the sqlite backend.

  Instants are stored as Unix milliseconds; states as the integer value of
  model::BookingState.
*/

static constexpr const char* kSchema[] = {
    "CREATE TABLE IF NOT EXISTS booking ("
    " id TEXT PRIMARY KEY,"
    " room_id TEXT NOT NULL,"
    " user_id TEXT NOT NULL,"
    " title TEXT NOT NULL,"
    " description TEXT NOT NULL,"
    " attendees INTEGER,"
    " start_ms INTEGER NOT NULL,"
    " end_ms INTEGER NOT NULL,"
    " has_recurrence INTEGER NOT NULL,"
    " recurrence_frequency INTEGER NOT NULL,"
    " recurrence_interval INTEGER NOT NULL,"
    " recurrence_end_ms INTEGER,"
    " recurrence_days TEXT NOT NULL,"
    " recurrence_count INTEGER,"
    " state INTEGER NOT NULL,"
    " version INTEGER NOT NULL,"
    " cancellation_reason TEXT NOT NULL,"
    " cancelled_by TEXT NOT NULL,"
    " cancelled_at_ms INTEGER,"
    " created_at_ms INTEGER NOT NULL,"
    " updated_at_ms INTEGER NOT NULL);",

    "CREATE INDEX IF NOT EXISTS booking_room_state ON booking(room_id, state);",
    "CREATE INDEX IF NOT EXISTS booking_user ON booking(user_id);",

    "CREATE TABLE IF NOT EXISTS booking_occurrence ("
    " booking_id TEXT NOT NULL REFERENCES booking(id) ON DELETE CASCADE,"
    " room_id TEXT NOT NULL,"
    " sequence_index INTEGER NOT NULL,"
    " start_ms INTEGER NOT NULL,"
    " end_ms INTEGER NOT NULL,"
    " PRIMARY KEY (booking_id, sequence_index));",

    "CREATE INDEX IF NOT EXISTS booking_occurrence_room_start ON booking_occurrence(room_id, start_ms);",
};

#define ROOMBOOK_BOOKING_COLUMNS                                                                                              \
  "id,room_id,user_id,title,description,attendees,start_ms,end_ms,has_recurrence,recurrence_frequency,recurrence_interval," \
  "recurrence_end_ms,recurrence_days,recurrence_count,state,version,cancellation_reason,cancelled_by,cancelled_at_ms,"        \
  "created_at_ms,updated_at_ms"

static constexpr const char* INSERT_BOOKING =
    "INSERT INTO booking(" ROOMBOOK_BOOKING_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_BOOKING =
    "SELECT " ROOMBOOK_BOOKING_COLUMNS " FROM booking WHERE id=?;";

// Columns bound in INSERT order starting at id; the version guard is the
// trailing parameter.
static constexpr const char* UPDATE_BOOKING =
    "UPDATE booking SET id=?,room_id=?,user_id=?,title=?,description=?,attendees=?,start_ms=?,end_ms=?,has_recurrence=?,"
    "recurrence_frequency=?,recurrence_interval=?,recurrence_end_ms=?,recurrence_days=?,recurrence_count=?,state=?,version=?,"
    "cancellation_reason=?,cancelled_by=?,cancelled_at_ms=?,created_at_ms=?,updated_at_ms=?"
    " WHERE id=? AND version=?;";

static constexpr const char* SELECT_BOOKING_VERSION =
    "SELECT version FROM booking WHERE id=?;";

// Optional filters use the (? IS NULL OR col = ?) form so a single
// statement serves every combination.
static constexpr const char* LIST_BOOKINGS =
    "SELECT " ROOMBOOK_BOOKING_COLUMNS " FROM booking"
    " WHERE (?1 IS NULL OR room_id=?1)"
    " AND (?2 IS NULL OR user_id=?2)"
    " AND (?3 IS NULL OR state=?3)"
    " AND (?4 IS NULL OR start_ms>=?4)"
    " AND (?5 IS NULL OR end_ms<=?5)"
    " ORDER BY start_ms, id LIMIT ?6 OFFSET ?7;";

// occurrences

static constexpr const char* DELETE_OCCURRENCES =
    "DELETE FROM booking_occurrence WHERE booking_id=?;";

static constexpr const char* INSERT_OCCURRENCE =
    "INSERT INTO booking_occurrence(booking_id,room_id,sequence_index,start_ms,end_ms)"
    " VALUES(?,?,?,?,?);";

static constexpr const char* SELECT_OCCURRENCES =
    "SELECT booking_id,room_id,sequence_index,start_ms,end_ms"
    " FROM booking_occurrence WHERE booking_id=? ORDER BY start_ms, sequence_index;";

// state IN (pending, confirmed)
static constexpr const char* SELECT_ACTIVE_OCCURRENCES =
    "SELECT o.booking_id,o.room_id,o.sequence_index,o.start_ms,o.end_ms"
    " FROM booking_occurrence o JOIN booking b ON b.id=o.booking_id"
    " WHERE o.room_id=?1 AND b.state IN (0,1)"
    " AND (?2 IS NULL OR o.end_ms>?2)"
    " AND (?3 IS NULL OR o.start_ms<?3)"
    " ORDER BY o.start_ms, o.booking_id, o.sequence_index;";

static constexpr const char* SELECT_ACTIVE_ROOMS =
    "SELECT DISTINCT room_id FROM booking WHERE state IN (0,1) ORDER BY room_id;";

} // namespace roombook::db::sql
