#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace sqlmigrate::util {

/*
  Time utilities: the single place that picks the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// "2025-11-21T08:15:02.123Z"
std::string FormatUnixMillis(uint64_t unix_ms);

} // namespace sqlmigrate::util
