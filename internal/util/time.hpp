#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace roombook::util {

/*
  Time utilities. All clock reads go through here.

  All instants are UTC. Text form is ISO 8601 "YYYY-MM-DDTHH:MM[:SS]Z";
  the trailing Z is optional on input.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// Throws std::invalid_argument on malformed input.
TimePoint   ParseIso8601(const std::string& text);
std::string FormatIso8601(TimePoint tp);

} // namespace roombook::util
