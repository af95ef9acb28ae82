#include "amount.hpp"

#include <cstdio>
#include <limits>

#include "errors.hpp"

namespace ledger::util {

int64_t ParseAmount(std::string_view text) {
  if (text.empty()) {
    throw ValidationError("amount is required");
  }
  if (text.front() == '-') {
    throw ValidationError("amount must not be negative");
  }
  if (text.front() == '+') text.remove_prefix(1);

  const auto dot        = text.find('.');
  const auto whole_part = text.substr(0, dot);
  const auto frac_part  = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);

  if (whole_part.empty() && frac_part.empty()) {
    throw ValidationError("invalid amount: " + std::string(text));
  }
  if (frac_part.size() > static_cast<size_t>(kAmountDecimals)) {
    throw ValidationError("amount precision exceeds " + std::to_string(kAmountDecimals) + " decimal places");
  }

  constexpr int64_t kMaxWhole = std::numeric_limits<int64_t>::max() / kUnitsPerWhole;

  int64_t whole = 0;
  for (char c : whole_part) {
    if (c < '0' || c > '9') throw ValidationError("invalid amount: " + std::string(text));
    whole = whole * 10 + (c - '0');
    if (whole > kMaxWhole) throw ValidationError("amount too large");
  }

  int64_t frac = 0;
  for (size_t i = 0; i < static_cast<size_t>(kAmountDecimals); ++i) {
    int digit = 0;
    if (i < frac_part.size()) {
      const char c = frac_part[i];
      if (c < '0' || c > '9') throw ValidationError("invalid amount: " + std::string(text));
      digit = c - '0';
    }
    frac = frac * 10 + digit;
  }

  return whole * kUnitsPerWhole + frac;
}

std::string FormatAmount(int64_t units) {
  const bool negative = units < 0;
  // int64 min has no positive counterpart; amounts never get there.
  const uint64_t magnitude = negative ? static_cast<uint64_t>(-(units + 1)) + 1 : static_cast<uint64_t>(units);

  std::string out = (negative ? "-" : "") + std::to_string(magnitude / kUnitsPerWhole);

  uint64_t frac = magnitude % kUnitsPerWhole;
  if (frac == 0) return out;

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%08llu", static_cast<unsigned long long>(frac));
  std::string digits(buf);
  while (!digits.empty() && digits.back() == '0') digits.pop_back();
  return out + "." + digits;
}

int64_t RoundToCents(int64_t units) {
  const int64_t half = kUnitsPerCent / 2;
  return units >= 0 ? (units + half) / kUnitsPerCent : -((-units + half) / kUnitsPerCent);
}

std::string FormatCents(int64_t cents) {
  const bool    negative  = cents < 0;
  const int64_t magnitude = negative ? -cents : cents;

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%s%lld.%02lld", negative ? "-" : "", static_cast<long long>(magnitude / 100),
                static_cast<long long>(magnitude % 100));
  return buf;
}

bool AddOverflows(int64_t a, int64_t b) {
  if (b > 0 && a > std::numeric_limits<int64_t>::max() - b) return true;
  if (b < 0 && a < std::numeric_limits<int64_t>::min() - b) return true;
  return false;
}

} // namespace ledger::util
