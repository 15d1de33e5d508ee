#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/booking_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/directory/room_directory.hpp"
#include "internal/events/event_dispatcher.hpp"
#include "internal/events/event_queue.hpp"

namespace roombook::factory {

/*
  Application

  Owns all long-lived components. The dispatcher is stopped (and the
  queue drained) when the Application is destroyed.

  Members are declared in dependency order so destruction stops the
  dispatcher before the queue and sink go away.
*/
struct Application {
  std::shared_ptr<db::Repository>                 repository;
  std::shared_ptr<const directory::RoomDirectory> rooms;
  std::shared_ptr<events::EventQueue>             event_queue;
  std::shared_ptr<events::EventSink>              event_sink;
  std::unique_ptr<events::EventDispatcher>        dispatcher;
  std::shared_ptr<core::BookingManager>           manager;
};

/*
  Composition root. The ONLY place allowed to know concrete repository,
  directory and sink types.
*/
Application Build(const roombook::runtime::config::RuntimeConfig& config);

core::EngineOptions EngineOptionsFromConfig(const roombook::runtime::config::RuntimeConfig& config);
core::PolicyOptions PolicyOptionsFromConfig(const roombook::runtime::config::RuntimeConfig& config);

} // namespace roombook::factory
