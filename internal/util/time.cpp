#include "time.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace roombook::util {

namespace {

int ParseDigits(const std::string& text, std::size_t pos, std::size_t len) {
  if (pos + len > text.size()) {
    throw std::invalid_argument("timestamp too short: " + text);
  }
  int value = 0;
  for (std::size_t i = pos; i < pos + len; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      throw std::invalid_argument("timestamp has non-digit at position " + std::to_string(i) + ": " + text);
    }
    value = value * 10 + (text[i] - '0');
  }
  return value;
}

void Expect(const std::string& text, std::size_t pos, char c) {
  if (pos >= text.size() || text[pos] != c) {
    throw std::invalid_argument(std::string("timestamp expected '") + c + "' at position " + std::to_string(pos) + ": " + text);
  }
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms))};
}

TimePoint ParseIso8601(const std::string& text) {
  const int year = ParseDigits(text, 0, 4);
  Expect(text, 4, '-');
  const int month = ParseDigits(text, 5, 2);
  Expect(text, 7, '-');
  const int day = ParseDigits(text, 8, 2);
  if (text.size() < 11 || (text[10] != 'T' && text[10] != ' ')) {
    throw std::invalid_argument("timestamp expected 'T' at position 10: " + text);
  }
  const int hour = ParseDigits(text, 11, 2);
  Expect(text, 13, ':');
  const int minute = ParseDigits(text, 14, 2);

  std::size_t pos    = 16;
  int         second = 0;
  if (pos < text.size() && text[pos] == ':') {
    second = ParseDigits(text, pos + 1, 2);
    pos += 3;
  }
  if (pos < text.size() && text[pos] == 'Z') {
    ++pos;
  }
  if (pos != text.size()) {
    throw std::invalid_argument("timestamp has trailing characters (only UTC is accepted): " + text);
  }

  const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok() || hour > 23 || minute > 59 || second > 59) {
    throw std::invalid_argument("timestamp out of range: " + text);
  }

  return std::chrono::sys_days{ymd} + std::chrono::hours(hour) + std::chrono::minutes(minute) + std::chrono::seconds(second);
}

std::string FormatIso8601(TimePoint tp) {
  const auto day_start = std::chrono::floor<std::chrono::days>(tp);
  const std::chrono::year_month_day ymd{day_start};
  const std::chrono::hh_mm_ss hms{std::chrono::floor<std::chrono::seconds>(tp - day_start)};

  std::ostringstream out;
  out << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-' << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
      << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T' << std::setw(2) << hms.hours().count() << ':' << std::setw(2)
      << hms.minutes().count() << ':' << std::setw(2) << hms.seconds().count() << 'Z';
  return out.str();
}

} // namespace roombook::util
