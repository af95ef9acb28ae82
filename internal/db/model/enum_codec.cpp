#include "enum_codec.hpp"

#include <stdexcept>
#include <string_view>

namespace ledger::db::model {

namespace {

constexpr std::string_view kPlatformPrefix  = "PLATFORM_TYPE_";
constexpr std::string_view kExclusionPrefix = "EXCLUSION_TYPE_";
constexpr std::string_view kPeriodPrefix    = "LIMIT_PERIOD_";
constexpr std::string_view kKindPrefix      = "OPERATION_KIND_";
constexpr std::string_view kStatusPrefix    = "OPERATION_STATUS_";

std::string Strip(const std::string& name, std::string_view prefix) {
  if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
    throw std::runtime_error("enum value has no storage code: " + name);
  }
  return name.substr(prefix.size());
}

template <typename Enum, typename ParseFn>
Enum ParseCode(const std::string& code, std::string_view prefix, ParseFn parse, const char* what) {
  Enum value{};
  if (code.empty() || !parse(std::string(prefix) + code, &value) || static_cast<int>(value) == 0) {
    throw std::runtime_error(std::string("unknown ") + what + " code: '" + code + "'");
  }
  return value;
}

} // namespace

std::string PlatformCode(ledger::v1::PlatformType v) {
  return Strip(ledger::v1::PlatformType_Name(v), kPlatformPrefix);
}

ledger::v1::PlatformType ParsePlatform(const std::string& code) {
  return ParseCode<ledger::v1::PlatformType>(code, kPlatformPrefix, ledger::v1::PlatformType_Parse, "platform");
}

std::string ExclusionTypeCode(ledger::v1::ExclusionType v) {
  return Strip(ledger::v1::ExclusionType_Name(v), kExclusionPrefix);
}

ledger::v1::ExclusionType ParseExclusionType(const std::string& code) {
  return ParseCode<ledger::v1::ExclusionType>(code, kExclusionPrefix, ledger::v1::ExclusionType_Parse, "exclusion type");
}

std::string LimitPeriodCode(ledger::v1::LimitPeriod v) {
  return Strip(ledger::v1::LimitPeriod_Name(v), kPeriodPrefix);
}

ledger::v1::LimitPeriod ParseLimitPeriod(const std::string& code) {
  return ParseCode<ledger::v1::LimitPeriod>(code, kPeriodPrefix, ledger::v1::LimitPeriod_Parse, "limit period");
}

std::string OperationKindCode(ledger::v1::OperationKind v) {
  return Strip(ledger::v1::OperationKind_Name(v), kKindPrefix);
}

ledger::v1::OperationKind ParseOperationKind(const std::string& code) {
  return ParseCode<ledger::v1::OperationKind>(code, kKindPrefix, ledger::v1::OperationKind_Parse, "operation kind");
}

std::string OperationStatusCode(ledger::v1::OperationStatus v) {
  return Strip(ledger::v1::OperationStatus_Name(v), kStatusPrefix);
}

ledger::v1::OperationStatus ParseOperationStatus(const std::string& code) {
  return ParseCode<ledger::v1::OperationStatus>(code, kStatusPrefix, ledger::v1::OperationStatus_Parse, "operation status");
}

} // namespace ledger::db::model
