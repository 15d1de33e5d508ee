#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/directory/static_room_directory.hpp"
#include "internal/events/log_event_sink.hpp"
#include "internal/observability/logging.hpp"

namespace roombook::factory {

using observability::StringField;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const roombook::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    const auto& sqlite = database.sqlite();

    db::sqlite::SqliteOptions options;
    options.path     = sqlite.path();
    options.wal_mode = sqlite.has_wal_mode() ? sqlite.wal_mode() : true;
    if (sqlite.busy_timeout_ms() > 0) options.busy_timeout_ms = static_cast<int>(sqlite.busy_timeout_ms());

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(std::move(options));
    sqlite_db->BootstrapSchema();
    ROOMBOOK_LOG_INFO("using sqlite repository", {StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  ROOMBOOK_LOG_INFO("using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<events::EventSink> BuildSink(const roombook::runtime::config::EventsConfig& events) {
  if (events.sink() == "none") {
    return std::make_shared<events::NullEventSink>();
  }
  if (events.sink().empty() || events.sink() == "log") {
    return std::make_shared<events::LogEventSink>();
  }
  throw std::runtime_error("unknown event sink: " + events.sink());
}

} // namespace

core::EngineOptions EngineOptionsFromConfig(const roombook::runtime::config::RuntimeConfig& config) {
  core::EngineOptions options;
  options.lock_timeout          = std::chrono::milliseconds(config.admission().lock_timeout_ms());
  options.persist_retry_backoff = std::chrono::milliseconds(config.admission().persist_retry_backoff_ms());
  options.max_occurrences       = config.recurrence().max_occurrences();
  options.max_horizon           = std::chrono::days(config.recurrence().max_horizon_days());
  options.max_parallel_rooms    = config.availability().max_parallel_rooms();
  return options;
}

core::PolicyOptions PolicyOptionsFromConfig(const roombook::runtime::config::RuntimeConfig& config) {
  const auto&         policy = config.booking_policy();
  core::PolicyOptions options;
  options.min_duration     = std::chrono::minutes(policy.min_duration_minutes());
  options.max_duration     = std::chrono::minutes(policy.max_duration_minutes());
  options.allow_past_start = policy.allow_past_start();
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const roombook::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.rooms      = std::make_shared<directory::StaticRoomDirectory>(directory::StaticRoomDirectory::FromConfig(config));

  // ------------------------------------------------------------------
  // Event pipeline
  // ------------------------------------------------------------------
  events::DispatchOptions dispatch;
  dispatch.max_delivery_attempts = config.events().max_delivery_attempts();
  dispatch.retry_backoff         = std::chrono::milliseconds(config.events().retry_backoff_ms());

  app.event_queue = std::make_shared<events::EventQueue>();
  app.event_sink  = BuildSink(config.events());
  app.dispatcher  = std::make_unique<events::EventDispatcher>(app.event_queue, app.event_sink, dispatch);
  app.dispatcher->Start();

  // ------------------------------------------------------------------
  // Core
  // ------------------------------------------------------------------
  app.manager = std::make_shared<core::BookingManager>(app.repository, app.rooms, app.event_queue, EngineOptionsFromConfig(config),
                                                       PolicyOptionsFromConfig(config));

  return app;
}

} // namespace roombook::factory
