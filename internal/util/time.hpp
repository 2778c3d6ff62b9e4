#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace curator::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// 2024-05-01T12:00:00.000000Z
std::string ToIso8601(TimePoint tp);

int64_t   ToUnixNanos(TimePoint tp);
TimePoint FromUnixNanos(int64_t nanos);

/*
  Accepts either ISO-8601 UTC ("YYYY-MM-DDTHH:MM:SS[.ffffff]Z") or an integer
  count of nanoseconds since the Unix epoch. Calendar fields are range
  checked (leap years included) and years start at 1970. Throws
  InvalidArgument otherwise.
*/
TimePoint ParseTimestamp(std::string_view text);

} // namespace curator::util
