#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace cardposter::util {

/*
  Wall-clock helpers. Cache timestamps are unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// strftime-style formatting in local time
std::string FormatLocal(TimePoint tp, const char* format);

// ISO-8601 UTC, second precision
std::string FormatIso8601(TimePoint tp);

} // namespace cardposter::util
