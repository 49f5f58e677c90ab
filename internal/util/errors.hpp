#pragma once

#include <stdexcept>
#include <string>

namespace relay::util {

/*
  Central error types.

  Lookup errors surface to the immediate caller. RestoreWillOverride is
  raised and contained inside restore; callers never see it.
*/

class NotInitialized : public std::runtime_error {
 public:
  explicit NotInitialized(const std::string& context) : std::runtime_error(context + " was not initialized") {
  }
};

class NoMatchingId : public std::runtime_error {
 public:
  explicit NoMatchingId(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MismatchedTopic : public std::runtime_error {
 public:
  explicit MismatchedTopic(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RestoreWillOverride : public std::runtime_error {
 public:
  explicit RestoreWillOverride(const std::string& context)
      : std::runtime_error("Restore will override already set " + context) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace relay::util
