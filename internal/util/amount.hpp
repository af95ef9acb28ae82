#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace ledger::util {

/*
  Fixed-point money.

  Balances and operation amounts are int64 counts of 1e-8 units (8 fractional
  digits, enough for every supported asset). USD values for gambling limits
  use the same scale. Lifetime statistics are kept in integer cents.
*/

constexpr int     kAmountDecimals = 8;
constexpr int64_t kUnitsPerWhole  = 100000000;
constexpr int64_t kUnitsPerCent   = kUnitsPerWhole / 100;

// Upper bound on any wallet balance.
constexpr int64_t kMaxBalanceUnits = 90000000000LL * kUnitsPerWhole;

// Parses an unsigned decimal string. Throws ValidationError on bad input,
// a negative value, more than 8 fractional digits, or overflow.
int64_t ParseAmount(std::string_view text);

// Formats units as a decimal string without trailing zeros ("12.5", "-3", "0").
std::string FormatAmount(int64_t units);

// Nearest cent, halves away from zero.
int64_t RoundToCents(int64_t units);

// "12.30"
std::string FormatCents(int64_t cents);

// True when a + b does not fit in int64.
bool AddOverflows(int64_t a, int64_t b);

} // namespace ledger::util
