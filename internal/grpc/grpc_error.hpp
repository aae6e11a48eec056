#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>
#include <string_view>

#include "internal/util/errors.hpp"

namespace recsync::grpc {

/*
  Converts internal exceptions into gRPC status codes (server side) and
  non-OK statuses into util::TransportFailure (client side).
*/

::grpc::Status ToStatus(const std::exception& e);

void ThrowIfNotOk(const ::grpc::Status& status, std::string_view rpc);

} // namespace recsync::grpc
