#pragma once

#include <stdexcept>
#include <string>

namespace engram::util {

/*
  Central error types.

  Every store backend translates its native failures (sqlite return codes,
  gRPC status) into these before they cross the Store interface. Callers
  branch on the type, never on the message.
*/

class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Single-entity lookup miss.
class NotFound : public StoreError {
 public:
  explicit NotFound(const std::string& msg) : StoreError(msg) {
  }
};

// Operation attempted before Initialize succeeded, or after Close.
class NotInitialized : public StoreError {
 public:
  explicit NotInitialized(const std::string& msg) : StoreError(msg) {
  }
};

// Backend unreachable at construction or initialization.
class ConnectionFailed : public StoreError {
 public:
  explicit ConnectionFailed(const std::string& msg) : StoreError(msg) {
  }
};

class AlreadyExists : public StoreError {
 public:
  explicit AlreadyExists(const std::string& msg) : StoreError(msg) {
  }
};

class InvalidArgument : public StoreError {
 public:
  explicit InvalidArgument(const std::string& msg) : StoreError(msg) {
  }
};

// Caller cancelled the call or its deadline passed.
class Cancelled : public StoreError {
 public:
  explicit Cancelled(const std::string& msg) : StoreError(msg) {
  }
};

} // namespace engram::util
