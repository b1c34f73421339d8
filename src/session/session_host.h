#pragma once

#include "src/session/session_errors.h"
#include "wombat/upnp.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace session {

constexpr uint16_t kDefaultSharePort = 45678;

// Throws PortPermissionError for EACCES/EPERM, BindError for everything else.
[[noreturn]] void throw_bind_error(const boost::system::error_code& ec, uint16_t port, const char* what);

// Hosts one file for remote receivers. share() maps the port, issues the session code and
// starts the accept loop on a background io thread; stop() closes the listener from any thread.
//
// Connections are served one at a time: authenticate, send the payload, close, accept the next.
class SessionHost {
 public:
  enum class State { Idle, MappingInProgress, Listening, Authenticating, Serving, Closed };

  struct Config {
    uint16_t port = kDefaultSharePort;
    std::string bind_address = "0.0.0.0";
    std::string description = "TnLCombatLogs";
    std::size_t secret_bytes = 32;
    // Per accepted connection; a stalled peer must not hold the listener.
    std::chrono::milliseconds idle_timeout{10000};
    int listen_backlog = 2;
    std::chrono::milliseconds accept_retry_delay{250};
  };

  SessionHost(Config cfg, std::unique_ptr<wombat::PortMapper> mapper);
  ~SessionHost();

  SessionHost(const SessionHost&) = delete;
  SessionHost& operator=(const SessionHost&) = delete;

  // Returns the session code. Throws LocalIoError, wombat::MappingError, PortPermissionError,
  // BindError or SessionStateError.
  std::string share(const std::filesystem::path& file);

  // Safe before share(), during an accept or a transfer, and more than once.
  void stop();

  State state() const { return state_.load(); }
  std::optional<std::string> status() const;
  std::string code() const;
  uint16_t local_port() const { return local_port_.load(); }
  uint64_t payloads_served() const { return payloads_served_.load(); }
  uint64_t auth_failures() const { return auth_failures_.load(); }
  uint64_t accept_errors() const { return accept_errors_.load(); }

 private:
  void bind_listener();
  void do_accept();
  void on_accept(const boost::system::error_code& ec);
  void on_secret(const boost::system::error_code& ec, const std::string& presented);
  void on_sent(const boost::system::error_code& ec);
  void arm_idle_timer();
  void disarm_idle_timer();
  void close_connection();
  void close_all();
  void set_status(std::string s);

  Config cfg_;
  std::unique_ptr<wombat::PortMapper> mapper_;

  boost::asio::io_context io_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
  std::thread io_thread_;
  boost::asio::ip::tcp::acceptor acceptor_{io_};
  std::optional<boost::asio::ip::tcp::socket> conn_;
  boost::asio::steady_timer idle_timer_{io_};
  boost::asio::steady_timer accept_retry_timer_{io_};
  uint64_t timer_generation_ = 0;

  std::shared_ptr<const std::string> payload_;
  std::string secret_;
  std::string code_;

  std::mutex mu_;
  mutable std::mutex status_mu_;
  std::optional<std::string> status_;

  std::atomic<State> state_{State::Idle};
  std::atomic<bool> stopped_by_user_{false};
  std::atomic<uint16_t> local_port_{0};
  std::atomic<uint64_t> payloads_served_{0};
  std::atomic<uint64_t> auth_failures_{0};
  std::atomic<uint64_t> accept_errors_{0};
};

const char* state_to_string(SessionHost::State s);

} // namespace session
