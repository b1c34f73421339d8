#pragma once

#include "wombat/upnp.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace test_support {

// Asks the kernel for a currently unused loopback port.
inline uint16_t free_port() {
  boost::asio::io_context io;
  boost::asio::ip::tcp::acceptor a(io);
  const boost::asio::ip::tcp::endpoint ep(boost::asio::ip::make_address("127.0.0.1"), 0);
  a.open(ep.protocol());
  a.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
  a.bind(ep);
  return a.local_endpoint().port();
}

inline std::filesystem::path temp_dir(const std::string& name) {
  std::mt19937_64 rng{std::random_device{}()};
  const auto dir = std::filesystem::temp_directory_path() / (name + "-" + std::to_string(rng()));
  std::filesystem::create_directories(dir);
  return dir;
}

inline std::filesystem::path write_file(const std::filesystem::path& dir,
                                        const std::string& name,
                                        const std::string& content) {
  const auto p = dir / name;
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out << content;
  return p;
}

inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds budget = std::chrono::milliseconds(3000)) {
  const auto deadline = std::chrono::steady_clock::now() + budget;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return pred();
}

// Loopback mapper that records how the host drives it.
class RecordingMapper : public wombat::PortMapper {
 public:
  struct Counters {
    std::atomic<int> establish{0};
    std::atomic<int> release{0};
  };

  explicit RecordingMapper(std::shared_ptr<Counters> counters,
                           std::optional<wombat::MappingError> fail_with = std::nullopt)
      : counters_(std::move(counters)), fail_with_(std::move(fail_with)) {}

  wombat::PortMapping establish(uint16_t port, std::string_view) override {
    ++counters_->establish;
    if (fail_with_) throw *fail_with_;
    return wombat::PortMapping{"127.0.0.1", port, "127.0.0.1"};
  }

  void release() override { ++counters_->release; }

 private:
  std::shared_ptr<Counters> counters_;
  std::optional<wombat::MappingError> fail_with_;
};

// Holds establish() until open() is called, like a gateway that is slow to answer.
class BlockingMapper : public wombat::PortMapper {
 public:
  struct Gate {
    std::mutex mu;
    std::condition_variable cv;
    bool entered = false;
    bool open = false;
    std::atomic<int> release{0};

    void wait_entered() {
      std::unique_lock lk(mu);
      cv.wait(lk, [this] { return entered; });
    }
    void let_through() {
      {
        std::lock_guard lk(mu);
        open = true;
      }
      cv.notify_all();
    }
  };

  explicit BlockingMapper(std::shared_ptr<Gate> gate,
                          std::optional<wombat::MappingError> fail_with = std::nullopt)
      : gate_(std::move(gate)), fail_with_(std::move(fail_with)) {}

  wombat::PortMapping establish(uint16_t port, std::string_view) override {
    std::unique_lock lk(gate_->mu);
    gate_->entered = true;
    gate_->cv.notify_all();
    gate_->cv.wait(lk, [this] { return gate_->open; });
    if (fail_with_) throw *fail_with_;
    return wombat::PortMapping{"127.0.0.1", port, "127.0.0.1"};
  }

  void release() override { ++gate_->release; }

 private:
  std::shared_ptr<Gate> gate_;
  std::optional<wombat::MappingError> fail_with_;
};

} // namespace test_support
