#include "src/session/session_host.h"

#include "wombat/crypto.hpp"
#include "wombat/framing.hpp"
#include "wombat/rendezvous_code.hpp"
#include "wombat/util.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <system_error>
#include <utility>

using boost::asio::ip::tcp;

namespace session {

namespace {

// The whole file or LocalIoError; a short read is never shared as a payload.
std::shared_ptr<const std::string> read_whole_file(const std::filesystem::path& file) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file, ec)) {
    throw LocalIoError("not a readable file: " + file.string());
  }
  const auto size = std::filesystem::file_size(file, ec);
  if (ec) throw LocalIoError("cannot stat " + file.string() + ": " + ec.message());
  if (size > std::numeric_limits<uint32_t>::max()) {
    throw LocalIoError(file.string() + " is too large to share (" + std::to_string(size) + " bytes)");
  }

  std::ifstream in(file, std::ios::binary);
  if (!in) throw LocalIoError("cannot open " + file.string());

  auto data = std::make_shared<std::string>(static_cast<std::size_t>(size), '\0');
  if (size > 0) {
    in.read(data->data(), static_cast<std::streamsize>(size));
    if (in.bad() || static_cast<uint64_t>(in.gcount()) != size) {
      throw LocalIoError("failed to read " + file.string() + " (" + std::to_string(in.gcount()) + " of " +
                         std::to_string(size) + " bytes)");
    }
  }
  return data;
}

} // namespace

const char* state_to_string(SessionHost::State s) {
  switch (s) {
    case SessionHost::State::Idle: return "idle";
    case SessionHost::State::MappingInProgress: return "mapping";
    case SessionHost::State::Listening: return "listening";
    case SessionHost::State::Authenticating: return "authenticating";
    case SessionHost::State::Serving: return "serving";
    case SessionHost::State::Closed: return "closed";
  }
  return "unknown";
}

void throw_bind_error(const boost::system::error_code& ec, uint16_t port, const char* what) {
  if (ec == boost::asio::error::access_denied || ec == boost::asio::error::no_permission) {
    throw PortPermissionError(port);
  }
  throw BindError(std::string(what) + " port " + std::to_string(port) + ": " + ec.message());
}

SessionHost::SessionHost(Config cfg, std::unique_ptr<wombat::PortMapper> mapper)
    : cfg_(std::move(cfg)), mapper_(std::move(mapper)) {
  if (!mapper_) throw std::invalid_argument("SessionHost: port mapper required");
  if (cfg_.port == 0) throw std::invalid_argument("SessionHost: port must be 1-65535");
  if (cfg_.secret_bytes == 0) throw std::invalid_argument("SessionHost: secret_bytes must be > 0");
}

SessionHost::~SessionHost() { stop(); }

std::string SessionHost::share(const std::filesystem::path& file) {
  {
    // stop() decides under the same lock whether it owns the teardown or leaves it to us.
    std::lock_guard lk(mu_);
    State expected = State::Idle;
    if (stopped_by_user_ || !state_.compare_exchange_strong(expected, State::MappingInProgress)) {
      throw SessionStateError(std::string("share: session is ") + state_to_string(state_.load()));
    }
  }

  wombat::PortMapping mapping;
  try {
    payload_ = read_whole_file(file);
    wombat::log("sharing " + file.string() + " (" + std::to_string(payload_->size()) + " bytes)");
    mapping = mapper_->establish(cfg_.port, cfg_.description);
  } catch (...) {
    std::lock_guard lk(mu_);
    payload_.reset();
    // A stop() that arrived meanwhile returned early and left Closed for us to set.
    state_ = stopped_by_user_ ? State::Closed : State::Idle;
    throw;
  }

  std::lock_guard lk(mu_);
  if (stopped_by_user_) {
    mapper_->release();
    payload_.reset();
    state_ = State::Closed;
    wombat::log("session stopped while mapping");
    throw SessionStateError("share: session was stopped while starting");
  }

  std::string code;
  try {
    secret_ = wombat::random_token_b64url(cfg_.secret_bytes);
    code = wombat::encode_code({mapping.public_address, mapping.external_port, secret_});
    bind_listener();
  } catch (...) {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
    mapper_->release();
    state_ = State::Idle;
    throw;
  }

  {
    std::lock_guard slk(status_mu_);
    code_ = code;
    status_.reset();
  }
  state_ = State::Listening;
  work_.emplace(boost::asio::make_work_guard(io_));
  boost::asio::post(io_, [this] { do_accept(); });
  io_thread_ = std::thread([this] {
    try {
      io_.run();
    } catch (const std::exception& e) {
      set_status(std::string("Error during transfer: ") + e.what());
      wombat::log(std::string("session loop terminated: ") + e.what());
    }
  });
  return code;
}

void SessionHost::bind_listener() {
  boost::system::error_code ec;
  const auto addr = boost::asio::ip::make_address(cfg_.bind_address, ec);
  if (ec) throw BindError("invalid bind address " + cfg_.bind_address + ": " + ec.message());
  const tcp::endpoint ep(addr, cfg_.port);

  acceptor_.open(ep.protocol(), ec);
  if (ec) throw_bind_error(ec, cfg_.port, "open listener on");
  acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
  if (ec) throw_bind_error(ec, cfg_.port, "set SO_REUSEADDR on");
  acceptor_.bind(ep, ec);
  if (ec) throw_bind_error(ec, cfg_.port, "bind");
  acceptor_.listen(cfg_.listen_backlog, ec);
  if (ec) throw_bind_error(ec, cfg_.port, "listen on");

  local_port_ = acceptor_.local_endpoint(ec).port();
  wombat::log("listening on " + cfg_.bind_address + ":" + std::to_string(cfg_.port));
}

void SessionHost::stop() {
  std::lock_guard lk(mu_);
  if (state_ == State::Closed) return;

  stopped_by_user_ = true;
  // share() is still talking to the gateway; it sees the flag and cleans up itself.
  if (state_ == State::MappingInProgress) return;

  if (io_thread_.joinable()) {
    boost::asio::post(io_, [this] { close_all(); });
    work_.reset();
    io_thread_.join();
  }
  // The loop thread is gone (or never ran); nothing else touches the sockets now.
  close_all();
  mapper_->release();
  state_ = State::Closed;
  wombat::log("session stopped");
}

std::optional<std::string> SessionHost::status() const {
  std::lock_guard lk(status_mu_);
  return status_;
}

std::string SessionHost::code() const {
  std::lock_guard lk(status_mu_);
  return code_;
}

void SessionHost::set_status(std::string s) {
  std::lock_guard lk(status_mu_);
  status_ = std::move(s);
}

void SessionHost::do_accept() {
  if (stopped_by_user_ || !acceptor_.is_open()) return;
  state_ = State::Listening;
  conn_.emplace(io_);
  acceptor_.async_accept(*conn_, [this](const boost::system::error_code& ec) { on_accept(ec); });
}

void SessionHost::on_accept(const boost::system::error_code& ec) {
  // Closing our own acceptor is the shutdown signal; anything else is a real fault.
  if (stopped_by_user_) return;
  if (ec) {
    if (!acceptor_.is_open()) {
      set_status("Listener closed: " + ec.message());
      wombat::log("accept loop ended: " + ec.message());
      return;
    }
    // Persistent faults (EMFILE and the like) fail again at once; pace the retries.
    ++accept_errors_;
    set_status("Accept failed: " + ec.message());
    wombat::log("accept error: " + ec.message() + "; retrying in " +
                std::to_string(cfg_.accept_retry_delay.count()) + " ms");
    accept_retry_timer_.expires_after(cfg_.accept_retry_delay);
    accept_retry_timer_.async_wait([this](const boost::system::error_code& tec) {
      if (!tec) do_accept();
    });
    return;
  }

  boost::system::error_code rec;
  const auto remote = conn_->remote_endpoint(rec);
  wombat::log("connection from " + (rec ? std::string("unknown peer") : wombat::endpoint_to_string(remote)));

  state_ = State::Authenticating;
  arm_idle_timer();
  wombat::async_read_secret(*conn_, secret_.size(),
                            [this](const boost::system::error_code& ec2, std::string presented) {
                              on_secret(ec2, presented);
                            });
}

void SessionHost::on_secret(const boost::system::error_code& ec, const std::string& presented) {
  disarm_idle_timer();
  if (stopped_by_user_) return;

  // A short read counts as a wrong secret. Either way: drop this peer, keep listening.
  if (ec || !wombat::secrets_equal(secret_, presented)) {
    ++auth_failures_;
    set_status("Authentication from remote user failed.");
    wombat::log(ec ? "authentication failed: " + ec.message() : std::string("authentication failed: wrong secret"));
    close_connection();
    do_accept();
    return;
  }

  state_ = State::Serving;
  arm_idle_timer();
  wombat::async_write_payload(*conn_, payload_,
                              [this](const boost::system::error_code& ec2) { on_sent(ec2); });
}

void SessionHost::on_sent(const boost::system::error_code& ec) {
  disarm_idle_timer();
  if (stopped_by_user_) return;

  if (ec) {
    set_status("Error during transfer: " + ec.message());
    wombat::log("transfer failed: " + ec.message());
  } else {
    ++payloads_served_;
    wombat::log("sent " + std::to_string(payload_->size()) + " bytes");
  }
  close_connection();
  do_accept();
}

// The generation check drops expiries that were already queued when the timer was re-armed.
void SessionHost::arm_idle_timer() {
  const uint64_t gen = ++timer_generation_;
  idle_timer_.expires_after(cfg_.idle_timeout);
  idle_timer_.async_wait([this, gen](const boost::system::error_code& ec) {
    if (ec || gen != timer_generation_ || !conn_) return;
    wombat::log("peer idle for " + std::to_string(cfg_.idle_timeout.count()) + " ms; dropping");
    boost::system::error_code ignored;
    conn_->close(ignored);
  });
}

void SessionHost::disarm_idle_timer() {
  ++timer_generation_;
  idle_timer_.cancel();
}

void SessionHost::close_connection() {
  if (!conn_) return;
  boost::system::error_code ignored;
  conn_->shutdown(tcp::socket::shutdown_both, ignored);
  conn_->close(ignored);
}

void SessionHost::close_all() {
  boost::system::error_code ignored;
  disarm_idle_timer();
  accept_retry_timer_.cancel();
  acceptor_.close(ignored);
  close_connection();
}

} // namespace session
