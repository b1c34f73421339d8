#pragma once

#include "wombat/framing.hpp"

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace session {

class ReceiveError : public std::runtime_error {
 public:
  enum class Kind {
    InvalidCode,
    ConnectionFailed,   // resolve/connect/send failures, timeouts, no length header
    TransferIncomplete, // closed before the declared length arrived
    InvalidPayload,     // declared length above the limit, or not UTF-8
  };

  ReceiveError(Kind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}

  Kind kind() const { return kind_; }

 private:
  Kind kind_;
};

const char* kind_to_string(ReceiveError::Kind k);

// Consumes a session code: connect, authenticate, receive exactly the declared payload.
// One attempt per call; callers retry by calling receive() again with the same code.
class SessionClient {
 public:
  struct Config {
    // Covers the whole exchange: resolve, connect, send, and every read.
    std::chrono::milliseconds timeout{10000};
    std::size_t max_payload = wombat::kDefaultMaxPayload;
  };

  SessionClient() = default;
  explicit SessionClient(Config cfg) : cfg_(cfg) {}

  std::string receive(std::string_view code) const { return receive(code, cfg_.timeout); }
  std::string receive(std::string_view code, std::chrono::milliseconds timeout) const;

 private:
  Config cfg_;
};

} // namespace session
