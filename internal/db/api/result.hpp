#pragma once

#include <string>

namespace recsync::db {

// Why a RecordStore write did not go through. SQLite and Postgres errors are
// mapped onto these inside their stores and never escape as backend types.
enum class ErrorCode {
  OK = 0,

  // Record or chain missing (UpdateWrappedKey on an unknown id).
  NotFound,
  // Push of a record id the store already holds.
  AlreadyExists,
  // Push whose parent is not the chain tail, or a second chain head.
  Conflict,
  // Store locked by another writer; surfaces as util::Conflict.
  Busy,
  // Record the chain rules reject, e.g. a timestamp not past its parent's.
  ConstraintViolation,

  IOError,
  Corruption,
  InternalError
};

const char* ToString(ErrorCode code);

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

// For callers with no recovery path: NotFound, AlreadyExists and
// Conflict/Busy raise their util:: counterparts, the rest StoreIoFailure.
void ThrowIfError(const Result& result, const std::string& prefix);

} // namespace recsync::db
