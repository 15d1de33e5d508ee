#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/booking_manager.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using namespace roombook;

static void Usage() {
  std::cout << "Usage:\n"
            << "  roombookctl --config <yaml> create <room> <user> <start> <end> [role=] [title=] [description=] [attendees=]\n"
            << "                                     [freq=daily|weekly|monthly] [interval=] [until=] [count=] [days=mon,wed] [override]\n"
            << "  roombookctl --config <yaml> reschedule <booking> <user> <expected_version> <start> <end> [role=] [title=] [description=] [attendees=]\n"
            << "                                         [freq=...] [override]\n"
            << "  roombookctl --config <yaml> cancel <booking> <user> [role=] [reason=]\n"
            << "  roombookctl --config <yaml> get <booking>\n"
            << "  roombookctl --config <yaml> list [room=] [user=] [state=] [from=] [to=] [limit=] [offset=]\n"
            << "  roombookctl --config <yaml> availability <start> <end> <room> [room...]\n"
            << "  roombookctl --config <yaml> conflicts <user> <role> [room=] [from=] [to=]\n"
            << "Times are ISO 8601 UTC, e.g. 2025-01-06T09:00Z\n";
}

// Trailing key=value options; a bare word is a flag.
static std::map<std::string, std::string> ParseOptions(int argc, char** argv, int first) {
  std::map<std::string, std::string> options;
  for (int i = first; i < argc; ++i) {
    std::string arg = argv[i];
    auto        eq  = arg.find('=');
    if (eq == std::string::npos) {
      options[arg] = "true";
    } else {
      options[arg.substr(0, eq)] = arg.substr(eq + 1);
    }
  }
  return options;
}

static std::optional<std::string> Option(const std::map<std::string, std::string>& options, const std::string& key) {
  auto it = options.find(key);
  if (it == options.end()) return std::nullopt;
  return it->second;
}

static model::Actor MakeActor(const std::string& user, const std::map<std::string, std::string>& options) {
  model::Actor actor{.user_id = user, .role = model::Role::kUser};
  if (auto role = Option(options, "role")) {
    auto parsed = model::ParseRole(*role);
    if (!parsed) throw util::InvalidArgument("unknown role: " + *role);
    actor.role = *parsed;
  }
  return actor;
}

static std::optional<model::RecurrencePattern> MakePattern(const std::map<std::string, std::string>& options) {
  auto freq = Option(options, "freq");
  if (!freq) return std::nullopt;

  auto frequency = model::ParseFrequency(*freq);
  if (!frequency) throw util::InvalidArgument("unknown frequency: " + *freq);

  model::RecurrencePattern pattern;
  pattern.frequency = *frequency;
  if (auto interval = Option(options, "interval")) pattern.interval = std::stoi(*interval);
  if (auto until = Option(options, "until")) pattern.end_date = util::ParseIso8601(*until);
  if (auto count = Option(options, "count")) pattern.count = std::stoi(*count);
  if (auto days = Option(options, "days")) pattern.days_of_week = model::ParseWeekdays(*days);
  return pattern;
}

static void PrintBooking(const model::Booking& booking) {
  std::cout << "id=" << booking.id << "\n"
            << "room=" << booking.room_id << "\n"
            << "user=" << booking.user_id << "\n"
            << "state=" << model::ToString(booking.state) << "\n"
            << "version=" << booking.version << "\n"
            << "start=" << util::FormatIso8601(booking.range.start()) << "\n"
            << "end=" << util::FormatIso8601(booking.range.end()) << "\n";
  if (!booking.title.empty()) std::cout << "title=" << booking.title << "\n";
  if (booking.recurrence) {
    std::cout << "recurrence=" << model::ToString(booking.recurrence->frequency) << "/" << booking.recurrence->interval << "\n";
  }
  if (!booking.cancellation_reason.empty()) {
    std::cout << "cancelled_by=" << booking.cancelled_by << "\n"
              << "reason=" << booking.cancellation_reason << "\n";
  }
  for (const auto& occurrence : booking.occurrences) {
    std::cout << "  #" << occurrence.sequence_index << " " << util::FormatIso8601(occurrence.range.start()) << " - "
              << util::FormatIso8601(occurrence.range.end()) << "\n";
  }
}

static void PrintConflicts(const std::vector<conflict::Conflict>& conflicts) {
  for (const auto& c : conflicts) {
    std::cout << "conflict " << util::FormatIso8601(c.candidate.range.start()) << " with " << c.existing.booking_id << " ["
              << util::FormatIso8601(c.existing.range.start()) << ", " << util::FormatIso8601(c.existing.range.end()) << ")\n";
  }
}

static int PrintOutcome(const core::BookingOutcome& outcome) {
  std::cout << "status=" << core::ToString(outcome.status) << "\n";
  if (outcome.booking) PrintBooking(*outcome.booking);
  PrintConflicts(outcome.conflicts);
  for (const auto& id : outcome.superseded) {
    std::cout << "superseded=" << id << "\n";
  }
  if (outcome.truncated) std::cout << "truncated=true\n";
  return outcome.ok() ? 0 : 3;
}

static int Run(core::BookingManager& manager, const std::string& cmd, int argc, char** argv, int first) {
  // ------------------------------------------------------------

  if (cmd == "create") {
    if (argc < first + 4) return 1;

    auto options = ParseOptions(argc, argv, first + 4);

    core::CreateBookingRequest request{
        .room_id    = argv[first],
        .actor      = MakeActor(argv[first + 1], options),
        .range      = model::TimeRange(util::ParseIso8601(argv[first + 2]), util::ParseIso8601(argv[first + 3])),
        .recurrence = MakePattern(options),
    };
    request.title              = Option(options, "title").value_or("");
    request.description        = Option(options, "description").value_or("");
    request.override_conflicts = options.contains("override");
    if (auto attendees = Option(options, "attendees")) request.attendees = static_cast<std::uint32_t>(std::stoul(*attendees));

    return PrintOutcome(manager.CreateBooking(request));
  }

  // ------------------------------------------------------------

  if (cmd == "reschedule") {
    if (argc < first + 5) return 1;

    auto options = ParseOptions(argc, argv, first + 5);

    core::RescheduleBookingRequest request{
        .booking_id       = argv[first],
        .actor            = MakeActor(argv[first + 1], options),
        .range            = model::TimeRange(util::ParseIso8601(argv[first + 3]), util::ParseIso8601(argv[first + 4])),
        .recurrence       = MakePattern(options),
        .expected_version = std::stoull(argv[first + 2]),
    };
    request.title              = Option(options, "title");
    request.description        = Option(options, "description");
    request.override_conflicts = options.contains("override");
    if (auto attendees = Option(options, "attendees")) request.attendees = static_cast<std::uint32_t>(std::stoul(*attendees));

    return PrintOutcome(manager.RescheduleBooking(request));
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < first + 2) return 1;

    auto options = ParseOptions(argc, argv, first + 2);

    core::CancelBookingRequest request{
        .booking_id = argv[first],
        .actor      = MakeActor(argv[first + 1], options),
        .reason     = Option(options, "reason").value_or(""),
    };
    return PrintOutcome(manager.CancelBooking(request));
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < first + 1) return 1;
    PrintBooking(manager.GetBooking(argv[first]));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    auto options = ParseOptions(argc, argv, first);

    core::BookingFilter filter;
    filter.room_id = Option(options, "room");
    filter.user_id = Option(options, "user");
    if (auto state = Option(options, "state")) {
      filter.state = model::ParseBookingState(*state);
      if (!filter.state) throw util::InvalidArgument("unknown state: " + *state);
    }
    if (auto from = Option(options, "from")) filter.from = util::ParseIso8601(*from);
    if (auto to = Option(options, "to")) filter.to = util::ParseIso8601(*to);
    if (auto limit = Option(options, "limit")) filter.limit = std::stoul(*limit);
    if (auto offset = Option(options, "offset")) filter.offset = std::stoul(*offset);

    for (const auto& booking : manager.ListBookings(filter)) {
      std::cout << booking.id << " " << booking.room_id << " " << model::ToString(booking.state) << " v" << booking.version << " "
                << util::FormatIso8601(booking.range.start()) << " - " << util::FormatIso8601(booking.range.end()) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "availability") {
    if (argc < first + 3) return 1;

    const model::TimeRange   query(util::ParseIso8601(argv[first]), util::ParseIso8601(argv[first + 1]));
    std::vector<std::string> rooms(argv + first + 2, argv + argc);

    for (const auto& window : manager.GetAvailability(rooms, query)) {
      std::cout << "room=" << window.room_id << "\n";
      for (const auto& busy : window.busy) {
        std::cout << "  busy " << util::FormatIso8601(busy.start()) << " - " << util::FormatIso8601(busy.end()) << "\n";
      }
      for (const auto& free : window.free) {
        std::cout << "  free " << util::FormatIso8601(free.start()) << " - " << util::FormatIso8601(free.end()) << "\n";
      }
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "conflicts") {
    if (argc < first + 2) return 1;

    auto options = ParseOptions(argc, argv, first + 2);
    options.emplace("role", argv[first + 1]);

    std::optional<model::TimeRange> window;
    auto                            from = Option(options, "from");
    auto                            to   = Option(options, "to");
    if (from && to) window.emplace(util::ParseIso8601(*from), util::ParseIso8601(*to));

    for (const auto& room : manager.ConflictReport(MakeActor(argv[first], options), Option(options, "room"), window)) {
      std::cout << "room=" << room.room_id << "\n";
      PrintConflicts(room.overlaps);
    }
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];

  try {
    auto config = roombook::config::ConfigLoader::LoadFromYaml(config_path);
    roombook::observability::InitializeLogging(config);

    int rc = 0;
    {
      auto app = roombook::factory::Build(config);
      rc       = Run(*app.manager, cmd, argc, argv, 4);
    }
    if (rc == 1) Usage();

    roombook::observability::ShutdownLogging();
    return rc;
  } catch (const util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
  } catch (const util::StaleBooking& e) {
    std::cerr << "stale: " << e.what() << "\n";
  } catch (const util::PermissionDenied& e) {
    std::cerr << "permission denied: " << e.what() << "\n";
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
  }

  roombook::observability::ShutdownLogging();
  return 2;
}
