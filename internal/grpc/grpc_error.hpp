#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

#include "internal/util/errors.hpp"

namespace ledger::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  Unknown exceptions become UNAVAILABLE with a generic message so
  internal details never reach the client.
*/

::grpc::Status ToStatus(const std::exception& e);

// Runs fn and maps any exception it throws through ToStatus.
template <typename Fn>
::grpc::Status Invoke(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace ledger::grpc
