#pragma once

#include <stdexcept>
#include <string>

namespace brewmon::util {

/*
  Central error types.

  These get translated later to gRPC status codes. Errors raised inside a
  poll cycle never escape the cycle; see monitor::PollCycle.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transient: the next cycle retries the read.
class HardwareUnavailable : public std::runtime_error {
 public:
  explicit HardwareUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Logical conflict; logged and absorbed by the lifecycle tracker.
class DuplicateOpenRecord : public std::runtime_error {
 public:
  explicit DuplicateOpenRecord(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RecordStoreWriteFailed : public std::runtime_error {
 public:
  explicit RecordStoreWriteFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace brewmon::util
