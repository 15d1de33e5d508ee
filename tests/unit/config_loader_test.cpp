#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using roombook::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "roombook_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestEmptyDocumentGetsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");

  assert(config.database().has_memory());
  assert(config.admission().lock_timeout_ms() == 2000);
  assert(config.admission().persist_retry_backoff_ms() == 50);
  assert(config.recurrence().max_occurrences() == 500);
  assert(config.recurrence().max_horizon_days() == 730);
  assert(config.booking_policy().min_duration_minutes() == 30);
  assert(config.booking_policy().max_duration_minutes() == 7 * 24 * 60);
  assert(!config.booking_policy().allow_past_start());
  assert(config.availability().max_parallel_rooms() == 8);
  assert(config.events().sink() == "log");
  assert(config.events().max_delivery_attempts() == 5);
  assert(config.rooms_size() == 0);
}

void TestFullFileIsLoaded() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
database:
  sqlite:
    path: "/var/lib/roombook/bookings.db"
    wal_mode: false
    busy_timeout_ms: 250
admission:
  lock_timeout_ms: 500
recurrence:
  max_occurrences: 52
booking_policy:
  min_duration_minutes: 15
  allow_past_start: true
events:
  sink: none
rooms:
  - id: atlas
    capacity: 12
  - id: borealis
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());

  assert(config.logging().level() == "debug");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/roombook/bookings.db");
  assert(config.database().sqlite().has_wal_mode());
  assert(!config.database().sqlite().wal_mode());
  assert(config.database().sqlite().busy_timeout_ms() == 250);
  assert(config.admission().lock_timeout_ms() == 500);
  assert(config.recurrence().max_occurrences() == 52);
  assert(config.recurrence().max_horizon_days() == 730);
  assert(config.booking_policy().min_duration_minutes() == 15);
  assert(config.booking_policy().allow_past_start());
  assert(config.events().sink() == "none");

  assert(config.rooms_size() == 2);
  assert(config.rooms(0).id() == "atlas");
  assert(config.rooms(0).capacity() == 12);
  assert(config.rooms(1).id() == "borealis");
  assert(config.rooms(1).capacity() == 0);
}

void TestWalModeLeftUnsetWhenOmitted() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: /tmp/roombook.db
)");
  assert(config.database().has_sqlite());
  assert(!config.database().sqlite().has_wal_mode());
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "C:\\rooms\\\"quoted\"\\1234"
rooms:
  - id: "1234"
  - id: "true"
)");

  assert(config.database().sqlite().path() == "C:\\rooms\\\"quoted\"\\1234");
  assert(config.rooms(0).id() == "1234");
  assert(config.rooms(1).id() == "true");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("unknown_field: 123\n") && "ConfigLoader must reject unknown fields.");
  assert(Rejects("admission:\n  lock_timeout: 5\n"));
}

void TestInvalidValuesAreRejected() {
  assert(Rejects("events:\n  sink: kafka\n"));
  assert(Rejects("database:\n  sqlite:\n    wal_mode: true\n"));
  assert(Rejects("booking_policy:\n  min_duration_minutes: 120\n  max_duration_minutes: 60\n"));
  assert(Rejects("rooms:\n  - capacity: 4\n"));
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/roombook.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEmptyDocumentGetsDefaults();
  TestFullFileIsLoaded();
  TestWalModeLeftUnsetWhenOmitted();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestMissingFileIsReported();

  std::cout << "roombook_unit_config_loader: pass\n";
  return 0;
}
