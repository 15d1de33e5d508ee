#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"

namespace {

using roombook::db::BookingQuery;
using roombook::db::ErrorCode;
using roombook::db::Repository;
using roombook::db::TimeWindow;
using roombook::db::memory::MemoryRepository;
using roombook::db::model::BookingRecord;
using roombook::db::model::OccurrenceRecord;

constexpr int32_t kPending   = 0;
constexpr int32_t kConfirmed = 1;
constexpr int32_t kCancelled = 2;

constexpr int64_t kHour = 60 * 60 * 1000;
constexpr int64_t kBase = 1736157600000; // 2025-01-06T10:00Z

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

BookingRecord Booking(const std::string& id, const std::string& room, int64_t start_ms, int32_t state = kConfirmed) {
  BookingRecord record;
  record.id            = id;
  record.room_id       = room;
  record.user_id       = "alice";
  record.start_ms      = start_ms;
  record.end_ms        = start_ms + kHour;
  record.state         = state;
  record.version       = 2;
  record.created_at_ms = static_cast<int64_t>(NowMs());
  record.updated_at_ms = record.created_at_ms;
  return record;
}

std::vector<OccurrenceRecord> Daily(const BookingRecord& booking, int days) {
  std::vector<OccurrenceRecord> out;
  for (int i = 0; i < days; ++i) {
    const int64_t start = booking.start_ms + i * 24 * kHour;
    out.push_back(OccurrenceRecord{
        .booking_id = booking.id, .room_id = booking.room_id, .sequence_index = static_cast<uint32_t>(i), .start_ms = start, .end_ms = start + kHour});
  }
  return out;
}

void VerifyRoundTripAllColumns(Repository& repo, const std::string& id) {
  auto record                 = Booking(id, "atlas", kBase);
  record.title                = "Quarterly planning";
  record.description          = "bring \"numbers\"";
  record.attendees            = 9;
  record.has_recurrence       = true;
  record.recurrence_frequency = 2;
  record.recurrence_interval  = 2;
  record.recurrence_days      = "mon,wed";
  record.recurrence_count     = 6;

  {
    auto tx = repo.Begin();
    assert(repo.InsertBooking(*tx, record));
    assert(repo.ReplaceOccurrences(*tx, id, Daily(record, 3)));
    tx->Commit();
  }

  auto tx   = repo.Begin();
  auto read = repo.GetBooking(*tx, id);
  assert(read.has_value());
  assert(read->room_id == "atlas");
  assert(read->title == record.title);
  assert(read->description == record.description);
  assert(read->attendees == 9u);
  assert(read->start_ms == kBase && read->end_ms == kBase + kHour);
  assert(read->has_recurrence);
  assert(read->recurrence_frequency == 2);
  assert(read->recurrence_interval == 2);
  assert(!read->recurrence_end_ms.has_value());
  assert(read->recurrence_days == "mon,wed");
  assert(read->recurrence_count == 6);
  assert(read->state == kConfirmed);
  assert(read->version == 2);
  assert(!read->cancelled_at_ms.has_value());

  auto occurrences = repo.GetOccurrences(*tx, id);
  assert(occurrences.size() == 3);
  assert(occurrences[2].sequence_index == 2);
  assert(occurrences[2].start_ms == kBase + 48 * kHour);
  tx->Commit();
}

void VerifyErrorCodes(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  assert(repo.InsertBooking(*tx, Booking(id, "atlas", kBase + 100 * kHour)));

  assert(repo.InsertBooking(*tx, Booking(id, "atlas", kBase)).code == ErrorCode::AlreadyExists);

  auto next    = Booking(id, "atlas", kBase + 100 * kHour);
  next.version = 3;
  assert(repo.UpdateBooking(*tx, next, 7).code == ErrorCode::Conflict);
  assert(repo.UpdateBooking(*tx, Booking(id + "-ghost", "atlas", kBase), 2).code == ErrorCode::NotFound);
  assert(repo.ReplaceOccurrences(*tx, id + "-ghost", {}).code == ErrorCode::NotFound);

  assert(repo.UpdateBooking(*tx, next, 2));
  assert(repo.GetBooking(*tx, id)->version == 3);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertBooking(*tx, Booking(id, "atlas", kBase)));
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertBooking(*tx, Booking(id, "atlas", kBase)));
    // destructor rolls back
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetBooking(*check_tx, id).has_value());
  check_tx->Commit();
}

void VerifyActiveOccurrences(Repository& repo, const std::string& prefix) {
  const auto room = prefix + "-room";

  auto series    = Booking(prefix + "-series", room, kBase);
  auto pending   = Booking(prefix + "-pending", room, kBase + 2 * kHour, kPending);
  auto cancelled = Booking(prefix + "-cancelled", room, kBase + 4 * kHour, kCancelled);
  {
    auto tx = repo.Begin();
    for (const auto* b : {&series, &pending, &cancelled}) {
      assert(repo.InsertBooking(*tx, *b));
    }
    assert(repo.ReplaceOccurrences(*tx, series.id, Daily(series, 3)));
    assert(repo.ReplaceOccurrences(*tx, pending.id, Daily(pending, 1)));
    assert(repo.ReplaceOccurrences(*tx, cancelled.id, Daily(cancelled, 1)));
    tx->Commit();
  }

  auto tx = repo.Begin();

  auto active = repo.ListActiveOccurrences(*tx, room, std::nullopt);
  assert(active.size() == 4);
  assert(active[0].booking_id == series.id && active[0].sequence_index == 0);
  assert(active[1].booking_id == pending.id);
  assert(active[2].booking_id == series.id && active[2].sequence_index == 1);
  for (const auto& occurrence : active) assert(occurrence.room_id == room);

  // Half-open window: touching occurrences are excluded.
  auto window = repo.ListActiveOccurrences(*tx, room, TimeWindow{.start_ms = kBase + kHour, .end_ms = kBase + 24 * kHour});
  assert(window.size() == 1);
  assert(window[0].booking_id == pending.id);

  auto rooms = repo.ListActiveRooms(*tx);
  assert(std::find(rooms.begin(), rooms.end(), room) != rooms.end());

  // Replacing the occurrence set is total, not a merge.
  assert(repo.ReplaceOccurrences(*tx, series.id, Daily(series, 1)));
  assert(repo.GetOccurrences(*tx, series.id).size() == 1);

  auto done    = series;
  done.state   = kCancelled;
  done.version = 3;
  assert(repo.UpdateBooking(*tx, done, 2));

  auto gone_pending    = pending;
  gone_pending.state   = kCancelled;
  gone_pending.version = 3;
  assert(repo.UpdateBooking(*tx, gone_pending, 2));

  assert(repo.ListActiveOccurrences(*tx, room, std::nullopt).empty());
  tx->Commit();

  auto check = repo.Begin();
  auto after = repo.ListActiveRooms(*check);
  assert(std::find(after.begin(), after.end(), room) == after.end());
  check->Commit();
}

void VerifyListBookings(Repository& repo, const std::string& prefix) {
  const auto room = prefix + "-list";
  {
    auto tx = repo.Begin();
    for (int i = 0; i < 5; ++i) {
      auto record = Booking(prefix + "-l" + std::to_string(4 - i), room, kBase + (4 - i) * kHour, i == 0 ? kCancelled : kConfirmed);
      if (i == 1) record.user_id = "bob";
      assert(repo.InsertBooking(*tx, record));
    }
    tx->Commit();
  }

  auto tx = repo.Begin();

  BookingQuery by_room;
  by_room.room_id = room;
  auto all        = repo.ListBookings(*tx, by_room);
  assert(all.size() == 5);
  for (int i = 0; i < 5; ++i) assert(all[i].id == prefix + "-l" + std::to_string(i));

  BookingQuery by_user = by_room;
  by_user.user_id      = "bob";
  auto bobs            = repo.ListBookings(*tx, by_user);
  assert(bobs.size() == 1 && bobs[0].id == prefix + "-l3");

  BookingQuery by_state = by_room;
  by_state.state        = kCancelled;
  auto cancelled        = repo.ListBookings(*tx, by_state);
  assert(cancelled.size() == 1 && cancelled[0].id == prefix + "-l4");

  BookingQuery window = by_room;
  window.from_ms      = kBase + kHour;
  window.to_ms        = kBase + 4 * kHour;
  auto inside         = repo.ListBookings(*tx, window);
  assert(inside.size() == 3);
  assert(inside[0].id == prefix + "-l1");

  BookingQuery page    = by_room;
  page.page.limit      = 2;
  page.page.offset     = 3;
  auto last_page       = repo.ListBookings(*tx, page);
  assert(last_page.size() == 2);
  assert(last_page[0].id == prefix + "-l3");
  assert(last_page[1].id == prefix + "-l4");
  tx->Commit();
}

void VerifyConcurrentUpdates(Repository& repo, const std::string& id, bool supports_parallel_transactions) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertBooking(*tx, Booking(id, "atlas", kBase + 500 * kHour)));
    tx->Commit();
  }

  if (!supports_parallel_transactions) {
    // Serialized backends: the second writer sees the first one's version.
    for (uint64_t expected : {2u, 3u}) {
      auto tx      = repo.Begin();
      auto current = repo.GetBooking(*tx, id);
      assert(current && current->version == expected);
      current->version = expected + 1;
      assert(repo.UpdateBooking(*tx, *current, expected));
      tx->Commit();
    }
    return;
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  auto r1 = repo.GetBooking(*tx1, id);
  auto r2 = repo.GetBooking(*tx2, id);
  assert(r1.has_value() && r2.has_value());

  r1->version = 3;
  r2->version = 3;

  assert(repo.UpdateBooking(*tx1, *r1, 2));
  assert(repo.UpdateBooking(*tx2, *r2, 2));
  tx1->Commit();

  bool threw = false;
  try {
    tx2->Commit();
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);

  auto verify_tx = repo.Begin();
  auto final     = repo.GetBooking(*verify_tx, id);
  assert(final.has_value());
  assert(final->version == 3);
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx     = repo->Begin();
    auto record = Booking(id, "durable-room", kBase);
    record.version = 11;
    assert(repo->InsertBooking(*tx, record));
    assert(repo->ReplaceOccurrences(*tx, id, Daily(record, 2)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto b  = repo->GetBooking(*tx, id);
  assert(b.has_value());
  assert(b->version == 11);
  assert(repo->ListActiveOccurrences(*tx, "durable-room", std::nullopt).size() == 2);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("roombook_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<roombook::db::sqlite::SqliteDB>(roombook::db::sqlite::SqliteOptions{.path = db_path});
    db->BootstrapSchema();
    return std::make_shared<roombook::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
      // One connection: a second Begin() waits for the first transaction.
      .supports_parallel_transactions = false,
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyRoundTripAllColumns(*repo, backend.name + "-roundtrip");
    VerifyErrorCodes(*repo, backend.name + "-errors");
    VerifyRollbackBehavior(*repo, backend.name + "-rollback");
    VerifyActiveOccurrences(*repo, backend.name + "-active");
    VerifyListBookings(*repo, backend.name);
    VerifyConcurrentUpdates(*repo, backend.name + "-concurrency", backend.supports_parallel_transactions);
  }

  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "roombook_integration_repository_parity: pass\n";
  return 0;
}
