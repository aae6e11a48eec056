#include "internal/db/api/result.hpp"

#include "internal/util/errors.hpp"

namespace recsync::db {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

void ThrowIfError(const Result& result, const std::string& prefix) {
  if (result) {
    return;
  }

  std::string message = prefix + ": " + ToString(result.code);
  if (!result.message.empty()) {
    message += " (" + result.message + ")";
  }

  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::Conflict:
    case ErrorCode::Busy:
      throw util::Conflict(message);
    default:
      throw util::StoreIoFailure(message);
  }
}

} // namespace recsync::db
