#ifndef UTIL_ERRORS_HPP
#define UTIL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace util {

// Raised while constructing a transport or a sandbox with an invalid
// combination of arguments. Never raised while running code.
class ConfigurationError : public std::invalid_argument {
 public:
  explicit ConfigurationError(const std::string& what)
      : std::invalid_argument(what) {}
};

// Raised when the remote session cannot be established, or breaks while a
// command is running.
class ConnectionError : public std::runtime_error {
 public:
  explicit ConnectionError(const std::string& what)
      : std::runtime_error(what) {}
};

// Raised when a remote command does not finish within its time budget.
class TimeoutError : public std::runtime_error {
 public:
  explicit TimeoutError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace util

#endif
