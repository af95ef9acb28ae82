#include "uuid.hpp"

#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

#include "errors.hpp"

namespace ledger::util {

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
  }
  return oss.str();
}

UUID FromString(const std::string& str) {
  if (!IsUUID(str)) throw ValidationError("Invalid UUID string");

  UUID        id{};
  std::string hex;
  for (char c : str)
    if (c != '-') hex += c;

  for (size_t i = 0; i < 16; ++i)
    id[i] = static_cast<uint8_t>(std::stoul(hex.substr(i * 2, 2), nullptr, 16));

  return id;
}

bool IsUUID(std::string_view str) {
  if (str.size() != 36) return false;

  for (size_t i = 0; i < str.size(); ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (str[i] != '-') return false;
      continue;
    }
    if (!std::isxdigit(static_cast<unsigned char>(str[i]))) return false;
  }
  return true;
}

std::string GenerateUUIDString() {
  return ToString(GenerateUUID());
}

} // namespace ledger::util
