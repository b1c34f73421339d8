#include "src/session/stop_signal.h"

#include "wombat/util.hpp"

#include <csignal>
#include <exception>
#include <string>
#include <utility>

namespace session {

StopOnSignal::StopOnSignal(std::function<void()> on_signal)
    : signals_(io_, SIGINT, SIGTERM), on_signal_(std::move(on_signal)) {
  signals_.async_wait([this](const boost::system::error_code& ec, int sig) {
    if (ec) return;
    fired_ = true;
    wombat::log("signal " + std::to_string(sig) + "; stopping");
    try {
      on_signal_();
    } catch (const std::exception& e) {
      wombat::log(std::string("stop failed: ") + e.what());
    }
  });
  thread_ = std::thread([this] { io_.run(); });
}

StopOnSignal::~StopOnSignal() {
  cancel();
  wait();
}

void StopOnSignal::wait() {
  if (thread_.joinable()) thread_.join();
}

void StopOnSignal::cancel() {
  boost::asio::post(io_, [this] {
    boost::system::error_code ignored;
    signals_.cancel(ignored);
  });
}

} // namespace session
