#include "caller_metadata.hpp"

#include <sstream>

namespace ledger::grpc {

namespace {

std::string Trim(std::string value) {
  const auto begin = value.find_first_not_of(" \t");
  if (begin == std::string::npos) return {};
  const auto end = value.find_last_not_of(" \t");
  return value.substr(begin, end - begin + 1);
}

} // namespace

policy::Caller CallerFrom(const ::grpc::ServerContext& ctx) {
  policy::Caller caller;
  const auto&    metadata = ctx.client_metadata();

  if (const auto it = metadata.find(kUserIdHeader); it != metadata.end()) {
    caller.user_id = Trim(std::string(it->second.data(), it->second.size()));
  }

  const auto [begin, end] = metadata.equal_range(kRolesHeader);
  for (auto it = begin; it != end; ++it) {
    std::istringstream in(std::string(it->second.data(), it->second.size()));
    std::string        role;
    while (std::getline(in, role, ',')) {
      role = Trim(role);
      if (!role.empty()) caller.roles.insert(role);
    }
  }

  return caller;
}

} // namespace ledger::grpc
