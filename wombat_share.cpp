#include "src/session/session_client.h"
#include "src/session/session_host.h"
#include "src/session/stop_signal.h"
#include "wombat/paths.hpp"
#include "wombat/upnp.hpp"
#include "wombat/util.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace {

struct Options {
  enum class Mode { Host, Receive };
  Mode mode = Mode::Host;

  // host
  std::string file;
  bool latest = false;
  uint16_t port = session::kDefaultSharePort;
  bool no_upnp = false;
  std::string advertise;
  std::string description = "TnLCombatLogs";

  // receive
  std::string code;
  int timeout_ms = 10000;
  std::string out_path;
};

std::optional<Options> parse_args(int argc, char** argv) {
  if (argc < 2) return std::nullopt;
  Options opt;
  const std::string mode = argv[1];
  if (mode == "host") {
    opt.mode = Options::Mode::Host;
  } else if (mode == "receive") {
    opt.mode = Options::Mode::Receive;
  } else {
    return std::nullopt;
  }

  if (const char* env = std::getenv("WOMBAT_SHARE_PORT"); env && *env) {
    const auto p = wombat::parse_port(env);
    if (!p) return std::nullopt;
    opt.port = *p;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    auto get_val = [&](std::string_view flag) -> std::optional<std::string> {
      if (a == flag) {
        if (i + 1 >= argc) return std::nullopt;
        return std::string(argv[++i]);
      }
      return std::nullopt;
    };

    if (opt.mode == Options::Mode::Host) {
      if (auto v = get_val("--port")) {
        const auto p = wombat::parse_port(*v);
        if (!p) return std::nullopt;
        opt.port = *p;
        continue;
      }
      if (a == "--no-upnp") {
        opt.no_upnp = true;
        continue;
      }
      if (auto v = get_val("--advertise")) {
        opt.advertise = *v;
        continue;
      }
      if (auto v = get_val("--description")) {
        opt.description = *v;
        continue;
      }
      if (a == "--latest") {
        opt.latest = true;
        continue;
      }
      if (!a.empty() && a[0] != '-' && opt.file.empty()) {
        opt.file = a;
        continue;
      }
    } else {
      if (auto v = get_val("--timeout-ms")) {
        try {
          opt.timeout_ms = std::stoi(*v);
        } catch (const std::exception&) {
          return std::nullopt;
        }
        if (opt.timeout_ms <= 0) return std::nullopt;
        continue;
      }
      if (auto v = get_val("--out")) {
        opt.out_path = *v;
        continue;
      }
      if (!a.empty() && a[0] != '-' && opt.code.empty()) {
        opt.code = a;
        continue;
      }
    }
    return std::nullopt;
  }

  if (opt.mode == Options::Mode::Host) {
    if (opt.file.empty() == !opt.latest) return std::nullopt; // exactly one of <file> / --latest
    if (opt.no_upnp && opt.advertise.empty()) return std::nullopt;
  } else if (opt.code.empty()) {
    return std::nullopt;
  }
  return opt;
}

int run_host(const Options& opt) {
  std::filesystem::path file = opt.file;
  if (opt.latest) {
    const auto dir = wombat::paths::resolve_log_dir();
    const auto latest = wombat::paths::latest_log_file(dir);
    if (!latest) {
      std::cerr << "error: no log files in " << dir.string() << "\n";
      return 1;
    }
    file = *latest;
  }

  std::unique_ptr<wombat::PortMapper> mapper;
  if (opt.no_upnp) {
    mapper = std::make_unique<wombat::StaticPortMapper>(opt.advertise);
  } else {
    mapper = std::make_unique<wombat::UpnpPortMapper>();
  }

  session::SessionHost::Config cfg;
  cfg.port = opt.port;
  cfg.description = opt.description;
  session::SessionHost host(cfg, std::move(mapper));
  // Installed before share(): an interrupt while the gateway is being configured must still
  // remove the mapping.
  session::StopOnSignal stop_on_signal([&host] { host.stop(); });

  std::string code;
  try {
    code = host.share(file);
  } catch (const session::SessionStateError&) {
    if (!stop_on_signal.fired()) throw;
    wombat::log("interrupted while starting; session closed");
    return 130;
  }
  std::cout << "Session code is " << code << "\n";
  std::cout.flush();

  stop_on_signal.wait();

  if (const auto st = host.status()) wombat::log("last status: " + *st);
  wombat::log("served " + std::to_string(host.payloads_served()) + " receiver(s)");
  return 0;
}

int run_receive(const Options& opt) {
  session::SessionClient::Config cfg;
  cfg.timeout = std::chrono::milliseconds(opt.timeout_ms);
  session::SessionClient client(cfg);

  const std::string text = client.receive(opt.code);
  if (opt.out_path.empty()) {
    std::cout << text;
    std::cout.flush();
    return 0;
  }

  std::ofstream out(opt.out_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    std::cerr << "error: cannot write " << opt.out_path << "\n";
    return 1;
  }
  out << text;
  if (!out.flush()) {
    std::cerr << "error: failed writing " << opt.out_path << "\n";
    return 1;
  }
  wombat::log("wrote " + std::to_string(text.size()) + " bytes to " + opt.out_path);
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  const auto opt = parse_args(argc, argv);
  if (!opt) {
    std::cerr << "Usage: " << argv[0]
              << " host (<file> | --latest) [--port <port>] [--no-upnp --advertise <ip>] [--description <tag>]\n"
              << "       " << argv[0] << " receive <code> [--timeout-ms <ms>] [--out <file>]\n"
              << "Default port: " << session::kDefaultSharePort << " (override with WOMBAT_SHARE_PORT)\n";
    return 2;
  }

  try {
    return opt->mode == Options::Mode::Host ? run_host(*opt) : run_receive(*opt);
  } catch (const session::ReceiveError& e) {
    std::cerr << "error (" << session::kind_to_string(e.kind()) << "): " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
