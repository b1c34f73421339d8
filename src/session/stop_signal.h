#pragma once

#include <utility>  // needed before Boost.Asio 1.74 (awaitable.hpp uses std::exchange)
#include <boost/asio.hpp>

#include <atomic>
#include <functional>
#include <thread>

namespace session {

// Runs `on_signal` once on SIGINT/SIGTERM, from a thread of its own, so the callback can
// interrupt a caller that is blocked in SessionHost::share().
class StopOnSignal {
 public:
  explicit StopOnSignal(std::function<void()> on_signal);
  ~StopOnSignal();

  StopOnSignal(const StopOnSignal&) = delete;
  StopOnSignal& operator=(const StopOnSignal&) = delete;

  // Returns once the callback has run, or after cancel().
  void wait();
  void cancel();
  bool fired() const { return fired_.load(); }

 private:
  boost::asio::io_context io_;
  boost::asio::signal_set signals_;
  std::function<void()> on_signal_;
  std::atomic<bool> fired_{false};
  std::thread thread_;
};

} // namespace session
