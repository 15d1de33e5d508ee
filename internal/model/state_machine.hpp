#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace roombook::model {

enum class BookingState : std::uint8_t {
  kPending   = 0,
  kConfirmed = 1,
  kCancelled = 2,
  kRejected  = 3,
};

constexpr bool IsTerminal(BookingState state) {
  return state == BookingState::kCancelled || state == BookingState::kRejected;
}

// Only active bookings occupy room time.
constexpr bool IsActive(BookingState state) {
  return state == BookingState::kPending || state == BookingState::kConfirmed;
}

constexpr bool CanTransition(BookingState from, BookingState to) {
  switch (from) {
    case BookingState::kPending:
      return to == BookingState::kConfirmed || to == BookingState::kRejected || to == BookingState::kCancelled;
    case BookingState::kConfirmed:
      return to == BookingState::kCancelled;
    case BookingState::kCancelled:
    case BookingState::kRejected:
      return false;
  }
  return false;
}

constexpr std::string_view ToString(BookingState state) {
  switch (state) {
    case BookingState::kPending:
      return "pending";
    case BookingState::kConfirmed:
      return "confirmed";
    case BookingState::kCancelled:
      return "cancelled";
    case BookingState::kRejected:
      return "rejected";
  }
  return "unknown";
}

constexpr std::optional<BookingState> ParseBookingState(std::string_view text) {
  if (text == "pending") return BookingState::kPending;
  if (text == "confirmed") return BookingState::kConfirmed;
  if (text == "cancelled") return BookingState::kCancelled;
  if (text == "rejected") return BookingState::kRejected;
  return std::nullopt;
}

} // namespace roombook::model
