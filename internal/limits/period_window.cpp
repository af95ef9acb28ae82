#include "period_window.hpp"

#include <cctype>
#include <chrono>

#include "internal/db/model/enum_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledger::limits {

namespace {

using std::chrono::days;
using std::chrono::sys_days;

int64_t ToMs(sys_days day) {
  return util::ToUnixMillis(util::TimePoint{day});
}

PeriodWindow FromDays(sys_days first, sys_days end_exclusive) {
  PeriodWindow window;
  window.start_ms  = ToMs(first);
  window.end_ms    = ToMs(end_exclusive) - 1;
  window.first_day = util::FormatDay(window.start_ms);
  window.last_day  = util::FormatDay(window.end_ms);
  return window;
}

} // namespace

PeriodWindow CurrentWindow(ledger::v1::LimitPeriod period, int64_t now_ms) {
  const sys_days                    today = std::chrono::floor<days>(util::FromUnixMillis(now_ms));
  const std::chrono::year_month_day ymd{today};

  switch (period) {
    case ledger::v1::LIMIT_PERIOD_DAILY:
      return FromDays(today, today + days{1});

    case ledger::v1::LIMIT_PERIOD_WEEKLY: {
      const std::chrono::weekday wd{today};
      const sys_days             sunday = today - days{wd.c_encoding()};
      return FromDays(sunday, sunday + days{7});
    }

    case ledger::v1::LIMIT_PERIOD_MONTHLY: {
      const sys_days first = ymd.year() / ymd.month() / 1;
      const sys_days last  = ymd.year() / ymd.month() / std::chrono::last;
      return FromDays(first, last + days{1});
    }

    case ledger::v1::LIMIT_PERIOD_HALF_YEAR: {
      const bool     first_half = ymd.month() <= std::chrono::June;
      const sys_days start      = ymd.year() / (first_half ? std::chrono::January : std::chrono::July) / 1;
      const sys_days end        = first_half ? sys_days{ymd.year() / std::chrono::July / 1}
                                             : sys_days{(ymd.year() + std::chrono::years{1}) / std::chrono::January / 1};
      return FromDays(start, end);
    }

    case ledger::v1::LIMIT_PERIOD_SESSION: {
      PeriodWindow window;
      window.start_ms  = now_ms - util::kDayMs;
      window.end_ms    = now_ms;
      window.first_day = util::FormatDay(window.start_ms);
      window.last_day  = util::FormatDay(window.end_ms);
      return window;
    }

    default:
      throw util::ValidationError("limit period is required");
  }
}

std::string PeriodName(ledger::v1::LimitPeriod period) {
  auto name = db::model::LimitPeriodCode(period);
  for (auto& c : name) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return name;
}

} // namespace ledger::limits
