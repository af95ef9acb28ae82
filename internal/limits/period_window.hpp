#pragma once

#include <cstdint>
#include <string>

#include "ledger/v1/types.pb.h"

namespace ledger::limits {

/*
  The current accounting window of a limit period, in UTC.

  start_ms/end_ms are inclusive bounds. first_day/last_day are the
  "YYYY-MM-DD" keys of the daily stats rows the window covers.
*/
struct PeriodWindow {
  int64_t start_ms = 0;
  int64_t end_ms   = 0;

  std::string first_day;
  std::string last_day;
};

/*
  DAILY     00:00 today .. 23:59:59.999
  WEEKLY    Sunday 00:00 .. Saturday 23:59:59.999
  MONTHLY   1st .. last day of the month
  HALF_YEAR Jan 1 .. Jun 30, or Jul 1 .. Dec 31
  SESSION   [now - 24h, now], counted by the days it touches

  Throws util::ValidationError for LIMIT_PERIOD_UNSPECIFIED.
*/
PeriodWindow CurrentWindow(ledger::v1::LimitPeriod period, int64_t now_ms);

// Lower case period name for user facing messages ("daily", "half_year").
std::string PeriodName(ledger::v1::LimitPeriod period);

} // namespace ledger::limits
