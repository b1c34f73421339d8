#pragma once

#include "wombat/util.hpp"

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace wombat {

// 32 bytes -> 43 printable characters.
inline std::string random_token_b64url(std::size_t nbytes = 32) {
  if (nbytes == 0) throw std::invalid_argument("random_token_b64url: nbytes must be > 0");
  std::vector<uint8_t> buf(nbytes);
  if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return base64url_encode(buf);
}

// Constant-time for equal lengths. A length mismatch returns false without touching the bytes.
inline bool secrets_equal(std::string_view expected, std::string_view presented) {
  if (expected.size() != presented.size()) return false;
  if (expected.empty()) return true;
  return CRYPTO_memcmp(expected.data(), presented.data(), expected.size()) == 0;
}

} // namespace wombat
