#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace ledger::util {

/*
  Time utilities. Single place to control clock source later.

  Persisted timestamps are UTC milliseconds since the epoch.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

constexpr int64_t kHourMs = 60LL * 60 * 1000;
constexpr int64_t kDayMs  = 24 * kHourMs;

TimePoint Now();
int64_t   NowMs();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// "YYYY-MM-DD" of the UTC day containing ms.
std::string FormatDay(int64_t ms);

// "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string FormatIso8601(int64_t ms);

} // namespace ledger::util
