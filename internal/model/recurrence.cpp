#include "recurrence.hpp"

#include <array>
#include <stdexcept>

namespace roombook::model {

namespace {

constexpr std::array<std::string_view, 7> kWeekdayNames = {"sun", "mon", "tue", "wed", "thu", "fri", "sat"};

} // namespace

std::string_view ToString(Frequency frequency) {
  switch (frequency) {
    case Frequency::kNone:
      return "none";
    case Frequency::kDaily:
      return "daily";
    case Frequency::kWeekly:
      return "weekly";
    case Frequency::kMonthly:
      return "monthly";
  }
  return "none";
}

std::optional<Frequency> ParseFrequency(std::string_view text) {
  if (text == "none") return Frequency::kNone;
  if (text == "daily") return Frequency::kDaily;
  if (text == "weekly") return Frequency::kWeekly;
  if (text == "monthly") return Frequency::kMonthly;
  return std::nullopt;
}

std::string_view ToString(Weekday day) {
  return kWeekdayNames[static_cast<std::size_t>(day) % kWeekdayNames.size()];
}

std::optional<Weekday> ParseWeekday(std::string_view text) {
  for (std::size_t i = 0; i < kWeekdayNames.size(); ++i) {
    if (kWeekdayNames[i] == text) {
      return static_cast<Weekday>(i);
    }
  }
  return std::nullopt;
}

std::string FormatWeekdays(const std::set<Weekday>& days) {
  std::string out;
  for (auto day : days) {
    if (!out.empty()) out += ',';
    out += ToString(day);
  }
  return out;
}

std::set<Weekday> ParseWeekdays(std::string_view text) {
  std::set<Weekday> days;
  while (!text.empty()) {
    const auto comma = text.find(',');
    const auto token = text.substr(0, comma);
    if (!token.empty()) {
      auto day = ParseWeekday(token);
      if (!day) {
        throw std::invalid_argument("unknown weekday: " + std::string(token));
      }
      days.insert(*day);
    }
    if (comma == std::string_view::npos) break;
    text.remove_prefix(comma + 1);
  }
  return days;
}

} // namespace roombook::model
