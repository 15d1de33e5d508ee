#include "booking_manager.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>
#include <thread>
#include <unordered_set>
#include <utility>

#include "internal/core/booking_mapper.hpp"
#include "internal/events/event_queue.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace roombook::core {

using observability::IntField;
using observability::StringField;
using roombook::v1::BookingEventType;

namespace {

constexpr const char* kSystemActor = "system";

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::Conflict:
      throw util::StaleBooking(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw std::runtime_error(message);
  }
}

// Distinct existing booking ids, in conflict order.
std::vector<std::string> ConflictingBookings(const std::vector<conflict::Conflict>& conflicts) {
  std::vector<std::string>        ids;
  std::unordered_set<std::string> seen;
  for (const auto& c : conflicts) {
    if (seen.insert(c.existing.booking_id).second) ids.push_back(c.existing.booking_id);
  }
  return ids;
}

std::vector<model::Occurrence> MakeOccurrences(const std::string& booking_id, const std::vector<model::TimeRange>& ranges) {
  std::vector<model::Occurrence> occurrences;
  occurrences.reserve(ranges.size());
  for (std::size_t i = 0; i < ranges.size(); ++i) {
    occurrences.push_back(model::Occurrence{.booking_id = booking_id, .range = ranges[i], .sequence_index = static_cast<std::uint32_t>(i)});
  }
  return occurrences;
}

bool MayActOn(const model::Actor& actor, const model::Booking& booking) {
  return actor.user_id == booking.user_id || model::CanOverride(actor.role);
}

} // namespace

std::string_view ToString(OutcomeStatus status) {
  switch (status) {
    case OutcomeStatus::kOk:
      return "ok";
    case OutcomeStatus::kConflict:
      return "conflict";
    case OutcomeStatus::kBusy:
      return "busy";
    case OutcomeStatus::kAborted:
      return "aborted";
  }
  return "unknown";
}

BookingManager::BookingManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<const directory::RoomDirectory> rooms,
                               std::shared_ptr<events::EventQueue> events, EngineOptions options, PolicyOptions policy)
    : repository_(std::move(repository)), rooms_(rooms), events_(std::move(events)), options_(options), policy_(policy, std::move(rooms)) {
  if (!repository_) {
    throw std::invalid_argument("BookingManager requires a repository");
  }
  if (options_.max_parallel_rooms == 0) options_.max_parallel_rooms = 1;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

recurrence::Expansion BookingManager::ExpandSeries(const model::TimeRange& base, const std::optional<model::RecurrencePattern>& pattern) const {
  if (!pattern || pattern->frequency == model::Frequency::kNone) {
    return recurrence::Expansion{.ranges = {base}, .truncated = false};
  }

  recurrence::Horizon horizon{.max_occurrences = options_.max_occurrences, .latest_start = std::nullopt};
  // Left open near the end of the clock's range; the expander stops there on its own.
  if (base.start() <= util::TimePoint::max() - options_.max_horizon) {
    horizon.latest_start = base.start() + options_.max_horizon;
  }
  auto expansion = recurrence::RecurrenceExpander::Expand(base, *pattern, horizon);
  if (expansion.ranges.empty()) {
    throw util::InvalidRecurrence("recurrence produces no occurrences");
  }
  return expansion;
}

std::optional<model::Booking> BookingManager::LoadBooking(db::Transaction& tx, const std::string& booking_id) {
  auto record = repository_->GetBooking(tx, booking_id);
  if (!record) return std::nullopt;
  return FromRecord(*record, repository_->GetOccurrences(tx, booking_id));
}

std::vector<model::Occurrence> BookingManager::LoadActive(db::Transaction& tx, const std::string& room_id,
                                                          const std::optional<model::TimeRange>& window) {
  std::optional<db::TimeWindow> scan;
  if (window) scan = db::TimeWindow{.start_ms = util::ToUnixMillis(window->start()), .end_ms = util::ToUnixMillis(window->end())};

  std::vector<model::Occurrence> out;
  for (const auto& record : repository_->ListActiveOccurrences(tx, room_id, scan)) {
    out.push_back(FromRecord(record));
  }
  return out;
}

std::shared_ptr<const RoomSnapshot> BookingManager::Snapshot(const std::string& room_id) {
  if (auto snapshot = snapshots_.Find(room_id)) {
    return snapshot;
  }

  std::vector<model::Occurrence> active;
  {
    auto tx = repository_->Begin();
    active  = LoadActive(*tx, room_id, std::nullopt);
    tx->Rollback();
  }
  return snapshots_.InstallIfAbsent(room_id, std::move(active));
}

void BookingManager::Persist(const std::string& context, const WriteFn& write) {
  for (int attempt = 1;; ++attempt) {
    try {
      auto tx = repository_->Begin();
      write(*repository_, *tx);
      tx->Commit();
      return;
    } catch (const util::StaleBooking&) {
      throw;
    } catch (const util::NotFound&) {
      throw;
    } catch (const db::TransactionConflict& e) {
      throw util::StaleBooking(context + ": " + e.what());
    } catch (const std::exception& e) {
      if (attempt >= 2) {
        ROOMBOOK_LOG_ERROR("persistence failed after retry", {StringField("context", context), StringField("error", e.what())});
        throw util::PersistenceFailure(context + ": " + e.what());
      }
      ROOMBOOK_LOG_WARN("persistence failed, retrying", {StringField("context", context), StringField("error", e.what())});
      std::this_thread::sleep_for(options_.persist_retry_backoff);
    }
  }
}

lock::RoomGuard BookingManager::AcquireRoom(const std::string& room_id, const lock::CancellationToken* cancel) {
  auto guard = room_locks_.Acquire(room_id, options_.lock_timeout, cancel);
  if (guard.Status() == lock::AcquireStatus::kTimedOut) {
    ROOMBOOK_LOG_WARN("room busy", {StringField("room_id", room_id), IntField("timeout_ms", options_.lock_timeout.count())});
  }
  return guard;
}

std::vector<model::Booking> BookingManager::Supersede(db::Transaction& tx, const std::vector<std::string>& booking_ids, const std::string& by,
                                                      util::TimePoint now) {
  std::vector<model::Booking> superseded;
  for (const auto& id : booking_ids) {
    auto record = repository_->GetBooking(tx, id);
    if (!record) {
      throw util::NotFound("superseded booking not found: " + id);
    }

    auto booking = FromRecord(*record, repository_->GetOccurrences(tx, id));
    if (!model::CanTransition(booking.state, model::BookingState::kCancelled)) {
      continue;
    }

    const auto expected         = booking.version;
    booking.state               = model::BookingState::kCancelled;
    booking.version             = expected + 1;
    booking.cancellation_reason = "superseded by " + by;
    booking.cancelled_by        = kSystemActor;
    booking.cancelled_at        = now;
    booking.updated_at          = now;

    ThrowIfDbError(repository_->UpdateBooking(tx, ToRecord(booking), expected), "supersede booking " + id);
    superseded.push_back(std::move(booking));
  }
  return superseded;
}

void BookingManager::PublishRoom(const std::string& room_id, const std::vector<model::Occurrence>& before, const std::vector<std::string>& removed,
                                 const std::vector<model::Occurrence>& added) {
  const std::unordered_set<std::string> drop(removed.begin(), removed.end());

  std::vector<model::Occurrence> next;
  next.reserve(before.size() + added.size());
  for (const auto& occurrence : before) {
    if (!drop.contains(occurrence.booking_id)) next.push_back(occurrence);
  }
  next.insert(next.end(), added.begin(), added.end());

  snapshots_.Publish(room_id, std::move(next));
}

void BookingManager::Emit(BookingEventType type, const model::Booking& booking, const std::string& actor_id, const std::string& reason,
                          const std::string& superseded_by) {
  if (!events_) return;

  roombook::v1::BookingEvent event;
  event.set_event_type(type);
  event.set_booking_id(booking.id);
  event.set_version(booking.version);
  *event.mutable_timestamp() = util::ToProto(util::Now());
  event.set_room_id(booking.room_id);
  event.set_user_id(booking.user_id);
  event.set_actor_id(actor_id);
  event.set_reason(reason);
  event.set_superseded_by(superseded_by);
  event.set_occurrence_count(static_cast<std::uint32_t>(booking.occurrences.size()));

  events_->Enqueue(std::move(event));
}

// ---------------------------------------------------------------------------
// Admission
// ---------------------------------------------------------------------------

BookingOutcome BookingManager::CreateBooking(const CreateBookingRequest& request) {
  const auto now = util::Now();

  policy_.CheckRoom(request.room_id);
  if (request.actor.user_id.empty()) {
    throw util::InvalidArgument("user id is required");
  }
  policy_.CheckRange(request.range, now);
  policy_.CheckAttendees(request.room_id, request.attendees);
  if (request.override_conflicts && !model::CanOverride(request.actor.role)) {
    throw util::PermissionDenied("role " + std::string(model::ToString(request.actor.role)) + " may not override conflicts");
  }

  auto expansion = ExpandSeries(request.range, request.recurrence);

  model::Booking booking{.id          = util::GenerateBookingId(),
                         .room_id     = request.room_id,
                         .user_id     = request.actor.user_id,
                         .title       = BookingPolicy::Truncate(request.title, BookingPolicy::kMaxTitleLength),
                         .description = BookingPolicy::Truncate(request.description, BookingPolicy::kMaxDescriptionLength),
                         .attendees   = request.attendees,
                         .range       = request.range};
  if (request.recurrence && request.recurrence->frequency != model::Frequency::kNone) {
    booking.recurrence = request.recurrence;
  }
  booking.state       = model::BookingState::kPending;
  booking.version     = 1;
  booking.occurrences = MakeOccurrences(booking.id, expansion.ranges);
  booking.created_at  = now;
  booking.updated_at  = now;

  BookingOutcome outcome;
  outcome.truncated = expansion.truncated;

  auto guard = AcquireRoom(request.room_id, request.cancel);
  if (!guard.OwnsRoom()) {
    outcome.status = guard.Status() == lock::AcquireStatus::kCancelled ? OutcomeStatus::kAborted : OutcomeStatus::kBusy;
    return outcome;
  }

  // From here on the admission always runs to completion.
  std::vector<model::Occurrence> active;
  {
    auto tx = repository_->Begin();
    active  = LoadActive(*tx, request.room_id, std::nullopt);
    tx->Rollback();
  }

  outcome.conflicts = conflict::ConflictDetector::FindConflicts(booking.occurrences, active);

  if (!conflict::ConflictDetector::Admissible(outcome.conflicts) && !request.override_conflicts) {
    booking.state   = model::BookingState::kRejected;
    booking.version = 2;

    Persist("reject booking " + booking.id, [&](db::Repository& repo, db::Transaction& tx) {
      ThrowIfDbError(repo.InsertBooking(tx, ToRecord(booking)), "insert booking " + booking.id);
      ThrowIfDbError(repo.ReplaceOccurrences(tx, booking.id, ToOccurrenceRecords(booking)), "insert occurrences " + booking.id);
    });

    ROOMBOOK_LOG_INFO("booking rejected", {StringField("booking_id", booking.id), StringField("room_id", booking.room_id),
                                           IntField("conflicts", static_cast<std::int64_t>(outcome.conflicts.size()))});
    Emit(roombook::v1::BOOKING_EVENT_TYPE_REJECTED, booking, request.actor.user_id, "conflict");

    outcome.status  = OutcomeStatus::kConflict;
    outcome.booking = std::move(booking);
    return outcome;
  }

  booking.state   = model::BookingState::kConfirmed;
  booking.version = 2;

  const auto                  to_supersede = ConflictingBookings(outcome.conflicts);
  std::vector<model::Booking> superseded;

  Persist("confirm booking " + booking.id, [&](db::Repository& repo, db::Transaction& tx) {
    superseded = Supersede(tx, to_supersede, booking.id, now);
    ThrowIfDbError(repo.InsertBooking(tx, ToRecord(booking)), "insert booking " + booking.id);
    ThrowIfDbError(repo.ReplaceOccurrences(tx, booking.id, ToOccurrenceRecords(booking)), "insert occurrences " + booking.id);
  });

  PublishRoom(booking.room_id, active, to_supersede, booking.occurrences);

  for (const auto& old : superseded) {
    outcome.superseded.push_back(old.id);
    Emit(roombook::v1::BOOKING_EVENT_TYPE_SUPERSEDED, old, kSystemActor, old.cancellation_reason, booking.id);
  }
  Emit(roombook::v1::BOOKING_EVENT_TYPE_CONFIRMED, booking, request.actor.user_id);

  ROOMBOOK_LOG_INFO("booking confirmed", {StringField("booking_id", booking.id), StringField("room_id", booking.room_id),
                                          IntField("occurrences", static_cast<std::int64_t>(booking.occurrences.size())),
                                          IntField("superseded", static_cast<std::int64_t>(superseded.size()))});

  outcome.status  = OutcomeStatus::kOk;
  outcome.booking = std::move(booking);
  return outcome;
}

BookingOutcome BookingManager::RescheduleBooking(const RescheduleBookingRequest& request) {
  const auto now = util::Now();

  std::optional<model::Booking> current;
  {
    auto tx = repository_->Begin();
    current = LoadBooking(*tx, request.booking_id);
    tx->Rollback();
  }
  if (!current) {
    throw util::NotFound("booking not found: " + request.booking_id);
  }
  if (!MayActOn(request.actor, *current)) {
    throw util::PermissionDenied("user " + request.actor.user_id + " may not reschedule booking " + request.booking_id);
  }
  if (request.override_conflicts && !model::CanOverride(request.actor.role)) {
    throw util::PermissionDenied("role " + std::string(model::ToString(request.actor.role)) + " may not override conflicts");
  }

  policy_.CheckRange(request.range, now);
  if (request.attendees) {
    policy_.CheckAttendees(current->room_id, request.attendees);
  }
  const auto pattern   = request.recurrence ? request.recurrence : current->recurrence;
  auto       expansion = ExpandSeries(request.range, pattern);

  const auto room_id = current->room_id;

  BookingOutcome outcome;
  outcome.truncated = expansion.truncated;

  auto guard = AcquireRoom(room_id, request.cancel);
  if (!guard.OwnsRoom()) {
    outcome.status  = guard.Status() == lock::AcquireStatus::kCancelled ? OutcomeStatus::kAborted : OutcomeStatus::kBusy;
    outcome.booking = std::move(current);
    return outcome;
  }

  std::vector<model::Occurrence> active;
  {
    auto tx = repository_->Begin();
    current = LoadBooking(*tx, request.booking_id);
    active  = LoadActive(*tx, room_id, std::nullopt);
    tx->Rollback();
  }
  if (!current) {
    throw util::NotFound("booking not found: " + request.booking_id);
  }
  if (!model::IsActive(current->state)) {
    throw util::InvalidTransition("cannot reschedule " + std::string(model::ToString(current->state)) + " booking " + current->id);
  }
  if (current->version != request.expected_version) {
    throw util::StaleBooking("booking " + current->id + " is at version " + std::to_string(current->version) + ", expected " +
                             std::to_string(request.expected_version));
  }

  auto candidates   = MakeOccurrences(current->id, expansion.ranges);
  outcome.conflicts = conflict::ConflictDetector::FindConflicts(candidates, active);

  if (!conflict::ConflictDetector::Admissible(outcome.conflicts) && !request.override_conflicts) {
    ROOMBOOK_LOG_INFO("reschedule conflicts", {StringField("booking_id", current->id), StringField("room_id", room_id),
                                               IntField("conflicts", static_cast<std::int64_t>(outcome.conflicts.size()))});
    outcome.status  = OutcomeStatus::kConflict;
    outcome.booking = std::move(current);
    return outcome;
  }

  model::Booking updated = *current;
  updated.range          = request.range;
  updated.recurrence     = pattern && pattern->frequency != model::Frequency::kNone ? pattern : std::nullopt;
  updated.occurrences    = std::move(candidates);
  if (request.title) updated.title = BookingPolicy::Truncate(*request.title, BookingPolicy::kMaxTitleLength);
  if (request.description) updated.description = BookingPolicy::Truncate(*request.description, BookingPolicy::kMaxDescriptionLength);
  if (request.attendees) updated.attendees = request.attendees;
  updated.state          = model::BookingState::kConfirmed;
  updated.version        = current->version + 1;
  updated.updated_at     = now;

  const auto                  to_supersede = ConflictingBookings(outcome.conflicts);
  std::vector<model::Booking> superseded;

  Persist("reschedule booking " + updated.id, [&](db::Repository& repo, db::Transaction& tx) {
    superseded = Supersede(tx, to_supersede, updated.id, now);
    ThrowIfDbError(repo.UpdateBooking(tx, ToRecord(updated), current->version), "update booking " + updated.id);
    ThrowIfDbError(repo.ReplaceOccurrences(tx, updated.id, ToOccurrenceRecords(updated)), "replace occurrences " + updated.id);
  });

  auto removed = to_supersede;
  removed.push_back(updated.id);
  PublishRoom(room_id, active, removed, updated.occurrences);

  for (const auto& old : superseded) {
    outcome.superseded.push_back(old.id);
    Emit(roombook::v1::BOOKING_EVENT_TYPE_SUPERSEDED, old, kSystemActor, old.cancellation_reason, updated.id);
  }
  Emit(roombook::v1::BOOKING_EVENT_TYPE_CONFIRMED, updated, request.actor.user_id, "rescheduled");

  ROOMBOOK_LOG_INFO("booking rescheduled", {StringField("booking_id", updated.id), StringField("room_id", room_id),
                                            IntField("version", static_cast<std::int64_t>(updated.version))});

  outcome.status  = OutcomeStatus::kOk;
  outcome.booking = std::move(updated);
  return outcome;
}

BookingOutcome BookingManager::CancelBooking(const CancelBookingRequest& request) {
  std::optional<model::Booking> current;
  {
    auto tx = repository_->Begin();
    current = LoadBooking(*tx, request.booking_id);
    tx->Rollback();
  }
  if (!current) {
    throw util::NotFound("booking not found: " + request.booking_id);
  }
  if (!MayActOn(request.actor, *current)) {
    throw util::PermissionDenied("user " + request.actor.user_id + " may not cancel booking " + request.booking_id);
  }

  const auto room_id = current->room_id;

  BookingOutcome outcome;
  auto           guard = AcquireRoom(room_id, request.cancel);
  if (!guard.OwnsRoom()) {
    outcome.status  = guard.Status() == lock::AcquireStatus::kCancelled ? OutcomeStatus::kAborted : OutcomeStatus::kBusy;
    outcome.booking = std::move(current);
    return outcome;
  }

  std::vector<model::Occurrence> active;
  {
    auto tx = repository_->Begin();
    current = LoadBooking(*tx, request.booking_id);
    active  = LoadActive(*tx, room_id, std::nullopt);
    tx->Rollback();
  }
  if (!current) {
    throw util::NotFound("booking not found: " + request.booking_id);
  }
  if (!model::CanTransition(current->state, model::BookingState::kCancelled)) {
    throw util::InvalidTransition("cannot cancel " + std::string(model::ToString(current->state)) + " booking " + current->id);
  }

  const auto now = util::Now();

  model::Booking cancelled     = *current;
  cancelled.state              = model::BookingState::kCancelled;
  cancelled.version            = current->version + 1;
  cancelled.cancellation_reason = BookingPolicy::Truncate(request.reason, BookingPolicy::kMaxReasonLength);
  cancelled.cancelled_by       = request.actor.user_id;
  cancelled.cancelled_at       = now;
  cancelled.updated_at         = now;

  Persist("cancel booking " + cancelled.id, [&](db::Repository& repo, db::Transaction& tx) {
    ThrowIfDbError(repo.UpdateBooking(tx, ToRecord(cancelled), current->version), "update booking " + cancelled.id);
  });

  PublishRoom(room_id, active, {cancelled.id}, {});
  Emit(roombook::v1::BOOKING_EVENT_TYPE_CANCELLED, cancelled, request.actor.user_id, cancelled.cancellation_reason);

  ROOMBOOK_LOG_INFO("booking cancelled", {StringField("booking_id", cancelled.id), StringField("room_id", room_id),
                                          StringField("cancelled_by", cancelled.cancelled_by)});

  outcome.status  = OutcomeStatus::kOk;
  outcome.booking = std::move(cancelled);
  return outcome;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

availability::AvailabilityWindow BookingManager::GetAvailability(const std::string& room_id, const model::TimeRange& query) {
  policy_.CheckRoom(room_id);
  auto snapshot = Snapshot(room_id);
  return availability::AvailabilityBuilder::Build(room_id, query, snapshot->occurrences);
}

std::vector<availability::AvailabilityWindow> BookingManager::GetAvailability(const std::vector<std::string>& room_ids,
                                                                              const model::TimeRange& query) {
  for (const auto& room_id : room_ids) {
    policy_.CheckRoom(room_id);
  }

  std::vector<availability::AvailabilityWindow> out;
  out.reserve(room_ids.size());

  // Rooms share nothing mutable, so each batch fans out freely.
  for (std::size_t begin = 0; begin < room_ids.size(); begin += options_.max_parallel_rooms) {
    const auto end = std::min(room_ids.size(), begin + options_.max_parallel_rooms);

    std::vector<std::future<availability::AvailabilityWindow>> batch;
    batch.reserve(end - begin);
    for (std::size_t i = begin; i < end; ++i) {
      batch.push_back(std::async(std::launch::async, [this, &room_id = room_ids[i], &query] {
        return availability::AvailabilityBuilder::Build(room_id, query, Snapshot(room_id)->occurrences);
      }));
    }
    for (auto& f : batch) {
      out.push_back(f.get());
    }
  }
  return out;
}

model::Booking BookingManager::GetBooking(const std::string& booking_id) {
  auto tx      = repository_->Begin();
  auto booking = LoadBooking(*tx, booking_id);
  tx->Rollback();
  if (!booking) {
    throw util::NotFound("booking not found: " + booking_id);
  }
  return std::move(*booking);
}

std::vector<model::Booking> BookingManager::ListBookings(const BookingFilter& filter) {
  db::BookingQuery query;
  query.room_id = filter.room_id;
  query.user_id = filter.user_id;
  if (filter.state) query.state = static_cast<std::int32_t>(*filter.state);
  if (filter.from) query.from_ms = util::ToUnixMillis(*filter.from);
  if (filter.to) query.to_ms = util::ToUnixMillis(*filter.to);
  query.page.limit  = filter.limit;
  query.page.offset = filter.offset;

  std::vector<model::Booking> out;
  auto                        tx = repository_->Begin();
  for (const auto& record : repository_->ListBookings(*tx, query)) {
    out.push_back(FromRecord(record, repository_->GetOccurrences(*tx, record.id)));
  }
  tx->Rollback();
  return out;
}

std::vector<RoomConflicts> BookingManager::ConflictReport(const model::Actor& actor, const std::optional<std::string>& room_id,
                                                          const std::optional<model::TimeRange>& window) {
  if (!model::CanAudit(actor.role)) {
    throw util::PermissionDenied("role " + std::string(model::ToString(actor.role)) + " may not view the conflict report");
  }

  std::vector<RoomConflicts> report;
  auto                       tx = repository_->Begin();

  const auto rooms = room_id ? std::vector<std::string>{*room_id} : repository_->ListActiveRooms(*tx);
  for (const auto& room : rooms) {
    auto overlaps = conflict::ConflictDetector::FindOverlapsWithin(LoadActive(*tx, room, window));
    if (!overlaps.empty()) {
      report.push_back(RoomConflicts{.room_id = room, .overlaps = std::move(overlaps)});
    }
  }
  tx->Rollback();
  return report;
}

} // namespace roombook::core
