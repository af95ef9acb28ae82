#include "time.hpp"

#include <cstdio>

namespace ledger::util {

TimePoint Now() {
  return Clock::now();
}

int64_t NowMs() {
  return ToUnixMillis(Now());
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::string FormatDay(int64_t ms) {
  const auto day = std::chrono::floor<std::chrono::days>(FromUnixMillis(ms));
  const std::chrono::year_month_day ymd{day};

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()));
  return buf;
}

std::string FormatIso8601(int64_t ms) {
  const auto tp  = FromUnixMillis(ms);
  const auto day = std::chrono::floor<std::chrono::days>(tp);
  const std::chrono::year_month_day ymd{day};
  const std::chrono::hh_mm_ss       hms{std::chrono::floor<std::chrono::milliseconds>(tp - day)};

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02ld:%02ld:%02lld.%03lldZ", static_cast<int>(ymd.year()),
                static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()), static_cast<long>(hms.hours().count()),
                static_cast<long>(hms.minutes().count()), static_cast<long long>(hms.seconds().count()),
                static_cast<long long>(hms.subseconds().count()));
  return buf;
}

} // namespace ledger::util
