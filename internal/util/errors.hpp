#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace msgstore::util {

/*
  Central error types.

  Limit violations are never retried; the caller decides (e.g. reject the
  create). Corruption is fatal to the open/recovery of the affected file.
*/

class TooManyChannels : public std::runtime_error {
 public:
  TooManyChannels() : std::runtime_error("too many channels") {
  }
};

class TooManySubs : public std::runtime_error {
 public:
  TooManySubs() : std::runtime_error("too many subscriptions per channel") {
  }
};

class Corruption : public std::runtime_error {
 public:
  explicit Corruption(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IOError : public std::runtime_error {
 public:
  explicit IOError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Runs `step`, remembering its error if none was recorded yet. Used by
  close paths that must attempt every step and report the first failure.
*/
template <typename F>
void CaptureFirstError(std::exception_ptr& first, F&& step) {
  try {
    step();
  } catch (const std::exception&) {
    if (!first) first = std::current_exception();
  }
}

} // namespace msgstore::util
