#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace session {

// The file to share could not be read. Raised before any network action.
class LocalIoError : public std::runtime_error {
 public:
  explicit LocalIoError(const std::string& what) : std::runtime_error(what) {}
};

// The OS refused the bind (EACCES/EPERM). Kept apart from BindError: the user can act on it by
// choosing another port or running with more privileges.
class PortPermissionError : public std::runtime_error {
 public:
  explicit PortPermissionError(uint16_t port)
      : std::runtime_error("Port " + std::to_string(port) + " is restricted."), port_(port) {}

  uint16_t port() const { return port_; }

 private:
  uint16_t port_;
};

class BindError : public std::runtime_error {
 public:
  explicit BindError(const std::string& what) : std::runtime_error(what) {}
};

// share() on a session that is not idle, or one stopped while it was starting.
class SessionStateError : public std::logic_error {
 public:
  explicit SessionStateError(const std::string& what) : std::logic_error(what) {}
};

} // namespace session
