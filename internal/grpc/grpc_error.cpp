#include "grpc_error.hpp"

#include <string>

namespace recsync::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace recsync::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const Conflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const SerializationFailure*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

void ThrowIfNotOk(const ::grpc::Status& status, std::string_view rpc) {
  if (status.ok()) return;
  throw util::TransportFailure(std::string(rpc) + " failed (code " + std::to_string(static_cast<int>(status.error_code())) +
                               "): " + status.error_message());
}

} // namespace recsync::grpc
