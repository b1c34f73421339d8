#pragma once

#include "wombat/json.hpp"
#include "wombat/util.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace wombat {

// What a receiver needs to reach and authenticate against a hosting session.
struct RendezvousInfo {
  std::string address;
  uint16_t port = 0;
  std::string secret;

  bool operator==(const RendezvousInfo&) const = default;
};

class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& what) : std::runtime_error("invalid session code: " + what) {}
};

inline bool is_valid_info(const RendezvousInfo& info) {
  return !info.address.empty() && info.port != 0 && !info.secret.empty();
}

// base64url(JSON {"ip","port","secret"}), unpadded.
inline std::string encode_code(const RendezvousInfo& info) {
  if (!is_valid_info(info)) throw std::invalid_argument("encode_code: incomplete rendezvous info");
  json j;
  j["ip"] = info.address;
  j["port"] = info.port;
  j["secret"] = info.secret;
  return base64url_encode(j.dump());
}

// All-or-nothing: either every field is present and valid or DecodeError is thrown.
inline RendezvousInfo decode_code(std::string_view code) {
  code = trim(code);
  if (code.empty()) throw DecodeError("empty");

  const auto bytes = base64url_decode(code);
  if (!bytes) throw DecodeError("not base64url");

  json j;
  try {
    j = json::parse(bytes->begin(), bytes->end());
  } catch (const json::parse_error&) {
    throw DecodeError("not JSON");
  }
  if (!j.is_object()) throw DecodeError("not a JSON object");

  if (!j.contains("ip") || !j["ip"].is_string()) throw DecodeError("missing ip");
  if (!j.contains("port") || !j["port"].is_number_integer()) throw DecodeError("missing port");
  if (!j.contains("secret") || !j["secret"].is_string()) throw DecodeError("missing secret");

  const auto port = j["port"].get<int64_t>();
  if (port < 1 || port > 65535) throw DecodeError("port out of range");

  RendezvousInfo out;
  out.address = j["ip"].get<std::string>();
  out.port = static_cast<uint16_t>(port);
  out.secret = j["secret"].get<std::string>();
  if (out.address.empty()) throw DecodeError("empty ip");
  if (out.secret.empty()) throw DecodeError("empty secret");
  return out;
}

} // namespace wombat
