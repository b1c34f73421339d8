#include "src/session/session_client.h"
#include "src/session/session_host.h"
#include "tests/test_support.hpp"
#include "wombat/framing.hpp"
#include "wombat/rendezvous_code.hpp"

#include <boost/asio.hpp>

#include <cassert>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using boost::asio::ip::tcp;
using namespace std::chrono_literals;

namespace {

session::SessionHost::Config loopback_config(uint16_t port) {
  session::SessionHost::Config cfg;
  cfg.port = port;
  cfg.bind_address = "127.0.0.1";
  cfg.idle_timeout = 500ms;
  return cfg;
}

std::unique_ptr<session::SessionHost> make_host(uint16_t port) {
  auto counters = std::make_shared<test_support::RecordingMapper::Counters>();
  return std::make_unique<session::SessionHost>(loopback_config(port),
                                                std::make_unique<test_support::RecordingMapper>(counters));
}

std::optional<session::ReceiveError::Kind> receive_error(const std::string& code,
                                                         std::chrono::milliseconds budget = 3000ms,
                                                         std::size_t max_payload = wombat::kDefaultMaxPayload) {
  session::SessionClient::Config cfg;
  cfg.max_payload = max_payload;
  session::SessionClient client(cfg);
  try {
    (void)client.receive(code, budget);
  } catch (const session::ReceiveError& e) {
    return e.kind();
  }
  return std::nullopt;
}

// Connects, presents `secret`, returns everything the host sent back before closing.
std::string raw_exchange(uint16_t port, const std::string& secret) {
  boost::asio::io_context io;
  tcp::socket s(io);
  s.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
  boost::asio::write(s, boost::asio::buffer(secret));
  std::string got;
  boost::system::error_code ec;
  boost::asio::read(s, boost::asio::dynamic_buffer(got), ec);
  assert(ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset);
  return got;
}

// One-shot fake host: reads the secret, then lets `respond` write whatever it wants and closes.
class FakeHost {
 public:
  FakeHost(std::size_t secret_len, std::function<void(tcp::socket&)> respond)
      : acceptor_(io_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    thread_ = std::thread([this, secret_len, respond = std::move(respond)] {
      tcp::socket s(io_);
      acceptor_.accept(s);
      std::string secret(secret_len, '\0');
      boost::system::error_code ec;
      boost::asio::read(s, boost::asio::buffer(secret), ec);
      if (!ec) respond(s);
      s.close(ec);
    });
  }
  ~FakeHost() { thread_.join(); }

  uint16_t port() const { return port_; }

 private:
  boost::asio::io_context io_;
  tcp::acceptor acceptor_;
  uint16_t port_ = 0;
  std::thread thread_;
};

void write_bytes(tcp::socket& s, const std::string& bytes) {
  boost::system::error_code ec;
  boost::asio::write(s, boost::asio::buffer(bytes), ec);
}

std::string header(uint32_t n) {
  const auto h = wombat::make_length_header(n);
  return std::string(reinterpret_cast<const char*>(h->data()), h->size());
}

void test_scenario_small_csv() {
  const auto dir = test_support::temp_dir("wombat-transfer");
  const std::string csv = "a,b,c\n1,2,3\n";
  const auto file = test_support::write_file(dir, "log.txt", csv);
  const uint16_t port = test_support::free_port();

  auto host = make_host(port);
  const std::string code = host->share(file);
  const auto info = wombat::decode_code(code);
  assert(info.address == "127.0.0.1");
  assert(info.port == port);
  assert(info.secret.size() == 43);
  assert(host->code() == code);

  // Raw wire check: 4-byte header 0x0000000C then the 12 bytes.
  const std::string wire = raw_exchange(port, info.secret);
  assert(wire.size() == 16);
  assert(wire.substr(0, 4) == std::string("\x00\x00\x00\x0C", 4));
  assert(wire.substr(4) == csv);

  session::SessionClient client;
  assert(client.receive(code) == csv);
  assert(test_support::wait_until([&] { return host->payloads_served() == 2; }));
  assert(!host->status().has_value());
  host->stop();
  std::filesystem::remove_all(dir);
}

void test_wrong_secret_then_correct() {
  const auto dir = test_support::temp_dir("wombat-transfer");
  const std::string csv = "name,damage\nfoo,12\n";
  const auto file = test_support::write_file(dir, "log.txt", csv);
  const uint16_t port = test_support::free_port();

  auto host = make_host(port);
  const std::string code = host->share(file);
  const auto info = wombat::decode_code(code);

  // Same length, last byte differs: closed with no header, listener survives.
  std::string wrong = info.secret;
  wrong.back() = wrong.back() == 'A' ? 'B' : 'A';
  assert(raw_exchange(port, wrong).empty());
  assert(test_support::wait_until([&] { return host->auth_failures() == 1; }));
  assert(host->status() == std::string("Authentication from remote user failed."));

  // Through the client: fails fast, no payload.
  const std::string wrong_code = wombat::encode_code({info.address, info.port, wrong});
  const auto kind = receive_error(wrong_code);
  assert(kind == session::ReceiveError::Kind::ConnectionFailed ||
         kind == session::ReceiveError::Kind::TransferIncomplete);

  // Lengthened secret: the host reads exactly its own length, which then mismatches.
  assert(raw_exchange(port, "x" + info.secret).empty());

  // Truncated secret: the host waits for the rest until the idle timeout, then drops it.
  assert(raw_exchange(port, info.secret.substr(0, info.secret.size() - 1)).empty());

  assert(test_support::wait_until([&] { return host->auth_failures() == 4; }));
  assert(host->payloads_served() == 0);

  session::SessionClient client;
  assert(client.receive(code) == csv);
  assert(test_support::wait_until([&] { return host->payloads_served() == 1; }));
  host->stop();
  std::filesystem::remove_all(dir);
}

void test_sequential_receivers_large_payload() {
  const auto dir = test_support::temp_dir("wombat-transfer");
  std::string big;
  for (int i = 0; big.size() < 3 * 1024 * 1024; ++i) {
    big += std::to_string(i) + ",Sk\xC3\xBCll Crusher,1234,crit\n";
  }
  const auto file = test_support::write_file(dir, "big.txt", big);
  const uint16_t port = test_support::free_port();

  auto host = make_host(port);
  const std::string code = host->share(file);

  session::SessionClient client;
  for (int i = 0; i < 3; ++i) assert(client.receive(code) == big);
  assert(test_support::wait_until([&] { return host->payloads_served() == 3; }));
  host->stop();
  std::filesystem::remove_all(dir);
}

void test_empty_payload() {
  const auto dir = test_support::temp_dir("wombat-transfer");
  const auto file = test_support::write_file(dir, "empty.txt", "");
  const uint16_t port = test_support::free_port();

  auto host = make_host(port);
  const std::string code = host->share(file);
  session::SessionClient client;
  assert(client.receive(code).empty());
  host->stop();
  std::filesystem::remove_all(dir);
}

void test_drop_after_header_is_incomplete() {
  const std::string secret = "s3cr3t-token-32bytes-long....";
  FakeHost fake(secret.size(), [](tcp::socket& s) { write_bytes(s, header(12) + "a,b,c"); });
  const std::string code = wombat::encode_code({"127.0.0.1", fake.port(), secret});
  assert(receive_error(code) == session::ReceiveError::Kind::TransferIncomplete);
}

void test_close_before_header() {
  const std::string secret = "s3cr3t";
  FakeHost fake(secret.size(), [](tcp::socket& s) { write_bytes(s, std::string("\x00\x00", 2)); });
  const std::string code = wombat::encode_code({"127.0.0.1", fake.port(), secret});
  assert(receive_error(code) == session::ReceiveError::Kind::ConnectionFailed);
}

void test_oversized_and_non_utf8_payloads() {
  const std::string secret = "s3cr3t";
  {
    FakeHost fake(secret.size(), [](tcp::socket& s) { write_bytes(s, header(0xFFFFFFFFu)); });
    const std::string code = wombat::encode_code({"127.0.0.1", fake.port(), secret});
    assert(receive_error(code, 3000ms, 1024) == session::ReceiveError::Kind::InvalidPayload);
  }
  {
    FakeHost fake(secret.size(), [](tcp::socket& s) { write_bytes(s, header(3) + "a\xFF" "b"); });
    const std::string code = wombat::encode_code({"127.0.0.1", fake.port(), secret});
    assert(receive_error(code) == session::ReceiveError::Kind::InvalidPayload);
  }
}

void test_silent_host_times_out() {
  const std::string secret = "s3cr3t";
  FakeHost fake(secret.size(), [](tcp::socket& s) {
    // Hold the connection open until the client gives up.
    std::string sink;
    boost::system::error_code ec;
    boost::asio::read(s, boost::asio::dynamic_buffer(sink), ec);
  });
  const std::string code = wombat::encode_code({"127.0.0.1", fake.port(), secret});
  const auto start = std::chrono::steady_clock::now();
  assert(receive_error(code, 300ms) == session::ReceiveError::Kind::ConnectionFailed);
  assert(std::chrono::steady_clock::now() - start < 3s);
}

void test_connection_refused_and_bad_code() {
  const uint16_t port = test_support::free_port();
  const std::string code = wombat::encode_code({"127.0.0.1", port, "secret"});
  assert(receive_error(code) == session::ReceiveError::Kind::ConnectionFailed);
  assert(receive_error("definitely not a code!") == session::ReceiveError::Kind::InvalidCode);
  assert(receive_error(wombat::base64url_encode(std::string("{\"ip\":\"127.0.0.1\"}"))) ==
         session::ReceiveError::Kind::InvalidCode);
}

} // namespace

int main() {
  test_scenario_small_csv();
  test_wrong_secret_then_correct();
  test_sequential_receivers_large_payload();
  test_empty_payload();
  test_drop_after_header_is_incomplete();
  test_close_before_header();
  test_oversized_and_non_utf8_payloads();
  test_silent_host_times_out();
  test_connection_refused_and_bad_code();
  return 0;
}
