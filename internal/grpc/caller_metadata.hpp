#pragma once

#include <grpcpp/grpcpp.h>

#include "internal/policy/operation_policy.hpp"

namespace ledger::grpc {

inline constexpr const char* kUserIdHeader = "x-user-id";
inline constexpr const char* kRolesHeader  = "x-roles";

// Identity from request metadata. x-roles is comma separated.
policy::Caller CallerFrom(const ::grpc::ServerContext& ctx);

} // namespace ledger::grpc
