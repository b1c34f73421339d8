#pragma once

#include "wombat/util.hpp"

#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <miniupnpc/miniupnpc.h>
#include <miniupnpc/upnpcommands.h>
#include <miniupnpc/upnperrors.h>

namespace wombat {

struct PortMapping {
  std::string public_address;
  uint16_t external_port = 0;
  std::string lan_address;
};

// Every stage of the gateway exchange fails distinctly; router problems are opaque to users
// and "it didn't work" is not actionable.
enum class MappingStage { Discover = 1, Select = 2, LanAddress = 3, AddMapping = 4, ExternalAddress = 5 };

inline std::string_view stage_to_string(MappingStage s) {
  switch (s) {
    case MappingStage::Discover: return "discover gateway";
    case MappingStage::Select: return "select gateway";
    case MappingStage::LanAddress: return "determine LAN address";
    case MappingStage::AddMapping: return "add port mapping";
    case MappingStage::ExternalAddress: return "query external address";
  }
  return "unknown";
}

class MappingError : public std::runtime_error {
 public:
  MappingError(MappingStage stage, std::string cause)
      : std::runtime_error("UPnP stage " + std::to_string(static_cast<int>(stage)) + " (" +
                           std::string(stage_to_string(stage)) + ") failed: " + cause),
        stage_(stage),
        cause_(std::move(cause)) {}

  MappingStage stage() const { return stage_; }
  const std::string& cause() const { return cause_; }

 private:
  MappingStage stage_;
  std::string cause_;
};

// Acquires an externally reachable TCP port. Not reentrant per machine: the external port is
// fixed by configuration, so only one session may hold it at a time.
class PortMapper {
 public:
  virtual ~PortMapper() = default;

  virtual PortMapping establish(uint16_t port, std::string_view description) = 0;
  virtual void release() = 0;
};

// No gateway: reports a configured address as-is (LAN sharing, manual forwarding, loopback).
class StaticPortMapper : public PortMapper {
 public:
  explicit StaticPortMapper(std::string advertised_address)
      : advertised_address_(std::move(advertised_address)) {}

  PortMapping establish(uint16_t port, std::string_view) override {
    if (advertised_address_.empty()) {
      throw MappingError(MappingStage::ExternalAddress, "no advertised address configured");
    }
    log("UPnP disabled; advertising " + advertised_address_ + ":" + std::to_string(port));
    return PortMapping{advertised_address_, port, advertised_address_};
  }

  void release() override {}

 private:
  std::string advertised_address_;
};

class UpnpPortMapper : public PortMapper {
 public:
  struct Config {
    int discover_delay_ms = 200;
    // 0 asks the gateway for a permanent mapping; release() removes it on stop.
    unsigned lease_seconds = 0;
  };

  UpnpPortMapper() = default;
  explicit UpnpPortMapper(Config cfg) : cfg_(cfg) {}
  ~UpnpPortMapper() override { release(); }

  UpnpPortMapper(const UpnpPortMapper&) = delete;
  UpnpPortMapper& operator=(const UpnpPortMapper&) = delete;

  PortMapping establish(uint16_t port, std::string_view description) override {
    int err = 0;
    UPNPDev* devlist = upnpDiscover(cfg_.discover_delay_ms, nullptr, nullptr, 0, 0, 2, &err);
    if (!devlist) {
      throw MappingError(MappingStage::Discover,
                         "no UPnP devices discovered (error " + std::to_string(err) + ")");
    }

    UPNPUrls urls;
    IGDdatas data;
    char lanaddr[64] = {};
    char wanaddr[64] = {};
    std::memset(&urls, 0, sizeof(urls));
    std::memset(&data, 0, sizeof(data));

    const int igd =
        UPNP_GetValidIGD(devlist, &urls, &data, lanaddr, sizeof(lanaddr), wanaddr, sizeof(wanaddr));
    freeUPNPDevlist(devlist);
    // 1: connected IGD, 2: connected IGD behind a reserved WAN address,
    // 3: IGD not connected, 4: UPnP device that is not an IGD.
    if (igd != 1 && igd != 2) {
      FreeUPNPUrls(&urls);
      if (igd == 0) throw MappingError(MappingStage::Select, "no valid IGD found");
      if (igd == 3) throw MappingError(MappingStage::Select, "IGD found but not connected");
      throw MappingError(MappingStage::Select, "UPnP device is not an IGD (code " + std::to_string(igd) + ")");
    }
    if (igd == 2) log("UPnP: gateway WAN address is reserved; peers may be unable to reach it");

    const std::string lan = lanaddr;
    const std::string control = urls.controlURL ? urls.controlURL : "";
    const std::string service = data.first.servicetype;
    FreeUPNPUrls(&urls);

    if (control.empty() || service.empty()) {
      throw MappingError(MappingStage::Select, "IGD info incomplete");
    }
    if (lan.empty()) {
      throw MappingError(MappingStage::LanAddress, "gateway reported no LAN address for this host");
    }

    const std::string port_s = std::to_string(port);
    const std::string desc(description);
    const std::string lease_s = std::to_string(cfg_.lease_seconds);
    const int rc = UPNP_AddPortMapping(control.c_str(),
                                       service.c_str(),
                                       port_s.c_str(),
                                       port_s.c_str(),
                                       lan.c_str(),
                                       desc.c_str(),
                                       "TCP",
                                       nullptr,
                                       lease_s.c_str());
    if (rc != UPNPCOMMAND_SUCCESS) {
      throw MappingError(MappingStage::AddMapping, upnp_error_string(rc));
    }
    mapping_ = Mapped{control, service, port};
    log("UPnP: mapped external TCP port " + port_s + " -> " + lan + ":" + port_s);

    char extaddr[64] = {};
    const int rc2 = UPNP_GetExternalIPAddress(control.c_str(), service.c_str(), extaddr);
    if (rc2 != UPNPCOMMAND_SUCCESS || extaddr[0] == '\0') {
      const std::string cause =
          rc2 != UPNPCOMMAND_SUCCESS ? upnp_error_string(rc2) : std::string("gateway returned an empty address");
      release();
      throw MappingError(MappingStage::ExternalAddress, cause);
    }

    log(std::string("UPnP: external address ") + extaddr);
    return PortMapping{extaddr, port, lan};
  }

  void release() override {
    if (!mapping_) return;
    const std::string ext_s = std::to_string(mapping_->external_port);
    const int rc = UPNP_DeletePortMapping(mapping_->control_url.c_str(),
                                         mapping_->service_type.c_str(),
                                         ext_s.c_str(),
                                         "TCP",
                                         nullptr);
    if (rc == UPNPCOMMAND_SUCCESS) {
      log("UPnP: removed mapping for external TCP port " + ext_s);
    } else {
      log("UPnP: failed to remove mapping (best-effort): " + upnp_error_string(rc));
    }
    mapping_.reset();
  }

 private:
  struct Mapped {
    std::string control_url;
    std::string service_type;
    uint16_t external_port = 0;
  };

  static std::string upnp_error_string(int rc) {
    const char* s = strupnperror(rc);
    return (s ? std::string(s) : std::string("UPnP error")) + " (" + std::to_string(rc) + ")";
  }

  Config cfg_;
  std::optional<Mapped> mapping_;
};

} // namespace wombat
