#pragma once

#include <stdexcept>
#include <string>

namespace recsync::util {

/*
  Central error types.

  The relay server maps these to gRPC status codes; the CLI prints them.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Parent is no longer the tail of its chain, or a transaction lost a race.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Any failure on the decrypt path. The message is constant so callers cannot
  tell which check rejected the input.
*/
class AuthenticationFailure : public std::runtime_error {
 public:
  AuthenticationFailure() : std::runtime_error("record failed authentication") {
  }
};

class StoreIoFailure : public std::runtime_error {
 public:
  explicit StoreIoFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransportFailure : public std::runtime_error {
 public:
  explicit TransportFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SerializationFailure : public std::runtime_error {
 public:
  explicit SerializationFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace recsync::util
