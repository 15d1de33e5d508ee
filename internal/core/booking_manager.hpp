#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/availability/availability_builder.hpp"
#include "internal/conflict/conflict_detector.hpp"
#include "internal/core/booking_policy.hpp"
#include "internal/core/room_snapshot_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/directory/room_directory.hpp"
#include "internal/lock/cancellation.hpp"
#include "internal/lock/room_lock_table.hpp"
#include "internal/model/booking.hpp"
#include "internal/recurrence/recurrence_expander.hpp"
#include "roombook/v1/events.pb.h"

namespace roombook::events {
class EventQueue;
}

namespace roombook::core {

struct EngineOptions {
  // Bound on the wait for a room's admission boundary.
  std::chrono::milliseconds lock_timeout{2000};
  std::chrono::milliseconds persist_retry_backoff{50};

  std::size_t max_occurrences = 500;
  std::chrono::days max_horizon{730};

  std::size_t max_parallel_rooms = 8;
};

struct CreateBookingRequest {
  std::string                             room_id;
  model::Actor                            actor; // becomes the owner
  model::TimeRange                        range;
  std::optional<model::RecurrencePattern> recurrence;

  std::string                  title;
  std::string                  description;
  std::optional<std::uint32_t> attendees;

  bool                            override_conflicts = false;
  const lock::CancellationToken*  cancel             = nullptr;
};

struct RescheduleBookingRequest {
  std::string      booking_id;
  model::Actor     actor;
  model::TimeRange range;
  // nullopt keeps the current pattern; Frequency::kNone drops it.
  std::optional<model::RecurrencePattern> recurrence;
  std::uint64_t                           expected_version = 0;

  // Details to replace along with the schedule; nullopt keeps the current value.
  std::optional<std::string>   title;
  std::optional<std::string>   description;
  std::optional<std::uint32_t> attendees;

  bool                           override_conflicts = false;
  const lock::CancellationToken* cancel             = nullptr;
};

struct CancelBookingRequest {
  std::string                    booking_id;
  model::Actor                   actor;
  std::string                    reason;
  const lock::CancellationToken* cancel = nullptr;
};

struct BookingFilter {
  std::optional<std::string>         room_id;
  std::optional<std::string>         user_id;
  std::optional<model::BookingState> state;
  std::optional<util::TimePoint>     from;
  std::optional<util::TimePoint>     to;
  std::size_t                        limit  = 100;
  std::size_t                        offset = 0;
};

enum class OutcomeStatus : std::uint8_t {
  kOk,
  kConflict, // normal outcome; conflicts holds the full set
  kBusy,     // room boundary wait timed out; retry
  kAborted,  // caller cancelled before the room was acquired; no side effects
};

std::string_view ToString(OutcomeStatus status);

struct BookingOutcome {
  OutcomeStatus                   status = OutcomeStatus::kOk;
  std::optional<model::Booking>   booking;
  std::vector<conflict::Conflict> conflicts;
  // Booking ids cancelled by an override admission.
  std::vector<std::string> superseded;
  // The recurrence horizon cut the series short.
  bool truncated = false;

  bool ok() const {
    return status == OutcomeStatus::kOk;
  }
};

struct RoomConflicts {
  std::string                     room_id;
  std::vector<conflict::Conflict> overlaps;
};

/*
  Booking lifecycle manager.

  Admission (create / reschedule) and cancellation for one room run under
  that room's gate: read the active occurrence set, expand the candidate,
  detect conflicts, persist, publish the room snapshot, emit events. Rooms
  never share a gate, so unrelated rooms proceed concurrently.

  Availability queries never take a gate; they read the room snapshot
  cache, which is republished before the gate is released.
*/
class BookingManager {
 public:
  BookingManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<const directory::RoomDirectory> rooms,
                 std::shared_ptr<events::EventQueue> events, EngineOptions options = {}, PolicyOptions policy = {});

  BookingOutcome CreateBooking(const CreateBookingRequest& request);
  BookingOutcome RescheduleBooking(const RescheduleBookingRequest& request);
  BookingOutcome CancelBooking(const CancelBookingRequest& request);

  availability::AvailabilityWindow              GetAvailability(const std::string& room_id, const model::TimeRange& query);
  std::vector<availability::AvailabilityWindow> GetAvailability(const std::vector<std::string>& room_ids, const model::TimeRange& query);

  model::Booking              GetBooking(const std::string& booking_id);
  std::vector<model::Booking> ListBookings(const BookingFilter& filter);

  // Overlapping active bookings as stored; elevated or auditor roles only.
  std::vector<RoomConflicts> ConflictReport(const model::Actor& actor, const std::optional<std::string>& room_id,
                                            const std::optional<model::TimeRange>& window = std::nullopt);

  const EngineOptions& Options() const {
    return options_;
  }

 private:
  using WriteFn = std::function<void(db::Repository&, db::Transaction&)>;

  recurrence::Expansion ExpandSeries(const model::TimeRange& base, const std::optional<model::RecurrencePattern>& pattern) const;

  std::optional<model::Booking> LoadBooking(db::Transaction& tx, const std::string& booking_id);
  std::vector<model::Occurrence> LoadActive(db::Transaction& tx, const std::string& room_id, const std::optional<model::TimeRange>& window);
  std::shared_ptr<const RoomSnapshot> Snapshot(const std::string& room_id);

  // One transaction; retried once on failure while the caller still holds the gate.
  void Persist(const std::string& context, const WriteFn& write);

  lock::RoomGuard AcquireRoom(const std::string& room_id, const lock::CancellationToken* cancel);

  std::vector<model::Booking> Supersede(db::Transaction& tx, const std::vector<std::string>& booking_ids, const std::string& by,
                                        util::TimePoint now);

  void PublishRoom(const std::string& room_id, const std::vector<model::Occurrence>& before, const std::vector<std::string>& removed,
                   const std::vector<model::Occurrence>& added);

  void Emit(roombook::v1::BookingEventType type, const model::Booking& booking, const std::string& actor_id, const std::string& reason = {},
            const std::string& superseded_by = {});

  std::shared_ptr<db::Repository>                 repository_;
  std::shared_ptr<const directory::RoomDirectory> rooms_;
  std::shared_ptr<events::EventQueue>             events_;
  EngineOptions                                   options_;
  BookingPolicy                                   policy_;

  lock::RoomLockTable room_locks_;
  RoomSnapshotCache   snapshots_;
};

} // namespace roombook::core
