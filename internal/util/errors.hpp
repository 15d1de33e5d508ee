#pragma once

#include <stdexcept>
#include <string>

namespace roombook::util {

/*
  Central error types.

  Conflicts, busy rooms and aborted requests are NOT errors; they are
  reported through core::BookingOutcome. Everything here is surfaced to the
  caller as a typed failure.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidRange : public std::runtime_error {
 public:
  explicit InvalidRange(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidRecurrence : public std::runtime_error {
 public:
  explicit InvalidRecurrence(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidTransition : public std::runtime_error {
 public:
  explicit InvalidTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Caller must re-fetch the booking and retry with the current version.
class StaleBooking : public std::runtime_error {
 public:
  explicit StaleBooking(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised after the single internal retry also failed. No state change occurred.
class PersistenceFailure : public std::runtime_error {
 public:
  explicit PersistenceFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace roombook::util
