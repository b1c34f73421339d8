#include "src/session/session_client.h"

#include "wombat/rendezvous_code.hpp"
#include "wombat/util.hpp"

#include <boost/asio.hpp>

#include <optional>
#include <utility>

using boost::asio::ip::tcp;

namespace session {

namespace {

// Drives one exchange on a private io_context. The caller bounds it with run_for().
class ReceiveOperation {
 public:
  ReceiveOperation(boost::asio::io_context& io, wombat::RendezvousInfo info, std::size_t max_payload)
      : socket_(io), resolver_(io), info_(std::move(info)), max_payload_(max_payload) {}

  void start() {
    resolver_.async_resolve(info_.address, std::to_string(info_.port),
                            [this](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                              if (ec) return fail(ReceiveError::Kind::ConnectionFailed, "resolve " + info_.address, ec);
                              connect(results);
                            });
  }

  // Budget exhausted: record the timeout first so the aborted handlers cannot overwrite it.
  void abort(std::chrono::milliseconds budget) {
    if (!done_) {
      done_ = true;
      error_.emplace(ReceiveError::Kind::ConnectionFailed,
                     "Connection failed: timed out after " + std::to_string(budget.count()) + " ms");
    }
    resolver_.cancel();
    close();
  }

  bool done() const { return done_; }

  std::string take_result() {
    if (error_) throw *error_;
    return std::move(payload_);
  }

 private:
  void connect(const tcp::resolver::results_type& results) {
    boost::asio::async_connect(socket_, results, [this](const boost::system::error_code& ec, const tcp::endpoint& ep) {
      if (ec) return fail(ReceiveError::Kind::ConnectionFailed, "connect to " + info_.address + ":" + std::to_string(info_.port), ec);
      wombat::log("connected to " + wombat::endpoint_to_string(ep));
      send_secret();
    });
  }

  void send_secret() {
    boost::asio::async_write(socket_, boost::asio::buffer(info_.secret),
                             [this](const boost::system::error_code& ec, std::size_t) {
                               if (ec) return fail(ReceiveError::Kind::ConnectionFailed, "send secret", ec);
                               read_header();
                             });
  }

  void read_header() {
    wombat::async_read_length_header(socket_, [this](const boost::system::error_code& ec, uint32_t len) {
      if (ec == boost::asio::error::eof) {
        return fail(ReceiveError::Kind::ConnectionFailed,
                    "Connection closed before metadata header was received.");
      }
      if (ec) return fail(ReceiveError::Kind::ConnectionFailed, "read length header", ec);
      if (len > max_payload_) {
        return fail(ReceiveError::Kind::InvalidPayload,
                    "declared payload of " + std::to_string(len) + " bytes exceeds limit of " +
                        std::to_string(max_payload_));
      }
      read_body(len);
    });
  }

  void read_body(uint32_t len) {
    wombat::async_read_payload_body(
        socket_, len, [this, len](const boost::system::error_code& ec, std::size_t got, std::string body) {
          if (ec) {
            return fail(ReceiveError::Kind::TransferIncomplete,
                        "Transfer incomplete: received " + std::to_string(got) + " of " +
                            std::to_string(len) + " bytes (" + ec.message() + ")");
          }
          if (!wombat::is_valid_utf8(body)) {
            return fail(ReceiveError::Kind::InvalidPayload, "payload is not valid UTF-8 text");
          }
          wombat::log("received " + std::to_string(body.size()) + " bytes");
          payload_ = std::move(body);
          done_ = true;
          close();
        });
  }

  void fail(ReceiveError::Kind kind, const std::string& what, const boost::system::error_code& ec) {
    fail(kind, "Connection failed: " + what + ": " + ec.message());
  }

  void fail(ReceiveError::Kind kind, std::string what) {
    if (done_) return;
    done_ = true;
    error_.emplace(kind, what);
    close();
  }

  void close() {
    boost::system::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

  tcp::socket socket_;
  tcp::resolver resolver_;
  wombat::RendezvousInfo info_;
  std::size_t max_payload_;

  bool done_ = false;
  std::optional<ReceiveError> error_;
  std::string payload_;
};

} // namespace

const char* kind_to_string(ReceiveError::Kind k) {
  switch (k) {
    case ReceiveError::Kind::InvalidCode: return "invalid code";
    case ReceiveError::Kind::ConnectionFailed: return "connection failed";
    case ReceiveError::Kind::TransferIncomplete: return "transfer incomplete";
    case ReceiveError::Kind::InvalidPayload: return "invalid payload";
  }
  return "unknown";
}

std::string SessionClient::receive(std::string_view code, std::chrono::milliseconds timeout) const {
  wombat::RendezvousInfo info;
  try {
    info = wombat::decode_code(code);
  } catch (const wombat::DecodeError& e) {
    throw ReceiveError(ReceiveError::Kind::InvalidCode, e.what());
  }
  wombat::log("connecting to " + info.address + ":" + std::to_string(info.port));

  boost::asio::io_context io;
  ReceiveOperation op(io, std::move(info), cfg_.max_payload);
  op.start();
  io.run_for(timeout);
  if (!op.done()) {
    op.abort(timeout);
    // Let the cancelled handlers finish before `op` goes out of scope.
    io.restart();
    io.run();
  }
  return op.take_result();
}

} // namespace session
