#pragma once

#include <utility>  // needed before Boost.Asio 1.74 (awaitable.hpp uses std::exchange)
#include <boost/asio.hpp>

#include <array>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>

namespace wombat {

// Wire contract, per connection:
//   client -> server: secret bytes (exactly the host's secret length)
//   server -> client: u32 big-endian payload length, then that many bytes of UTF-8 text
static constexpr std::size_t kLengthHeaderSize = 4;
static constexpr std::size_t kDefaultMaxPayload = 256u * 1024u * 1024u;

inline void write_u32_be(uint32_t v, uint8_t out[4]) {
  out[0] = static_cast<uint8_t>((v >> 24) & 0xFF);
  out[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
  out[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
  out[3] = static_cast<uint8_t>(v & 0xFF);
}

inline uint32_t read_u32_be(const uint8_t in[4]) {
  return (static_cast<uint32_t>(in[0]) << 24) | (static_cast<uint32_t>(in[1]) << 16) |
         (static_cast<uint32_t>(in[2]) << 8) | static_cast<uint32_t>(in[3]);
}

inline std::optional<std::array<uint8_t, kLengthHeaderSize>> make_length_header(std::size_t len) {
  if (len > std::numeric_limits<uint32_t>::max()) return std::nullopt;
  std::array<uint8_t, kLengthHeaderSize> out{};
  write_u32_be(static_cast<uint32_t>(len), out.data());
  return out;
}

// Rejects overlong encodings, surrogates and code points above U+10FFFF.
inline bool is_valid_utf8(std::span<const uint8_t> s) {
  std::size_t i = 0;
  while (i < s.size()) {
    const uint8_t c = s[i];
    if (c < 0x80) {
      ++i;
      continue;
    }
    std::size_t n = 0;
    uint32_t cp = 0;
    if ((c & 0xE0) == 0xC0) {
      n = 1;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      n = 2;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      n = 3;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + n >= s.size()) return false;
    for (std::size_t k = 1; k <= n; ++k) {
      const uint8_t cc = s[i + k];
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    if ((n == 1 && cp < 0x80) || (n == 2 && cp < 0x800) || (n == 3 && cp < 0x10000)) return false;
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
    i += n + 1;
  }
  return true;
}

inline bool is_valid_utf8(const std::string& s) {
  return is_valid_utf8(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(s.data()), s.size()));
}

// Server side, step 1: exactly `len` bytes or an error (eof on an early close).
template <class AsyncReadStream, class Handler>
inline void async_read_secret(AsyncReadStream& stream, std::size_t len, Handler&& handler) {
  auto buf = std::make_shared<std::string>(len, '\0');
  boost::asio::async_read(
      stream,
      boost::asio::buffer(*buf),
      [buf, handler = std::forward<Handler>(handler)](const boost::system::error_code& ec,
                                                      std::size_t) mutable {
        if (ec) return handler(ec, std::string{});
        handler(ec, std::move(*buf));
      });
}

// Server side, step 3: header and payload in one gathered write. The payload is shared
// with the session and never modified.
template <class AsyncWriteStream, class Handler>
inline void async_write_payload(AsyncWriteStream& stream,
                                std::shared_ptr<const std::string> payload,
                                Handler&& handler) {
  const auto header = make_length_header(payload->size());
  if (!header) {
    boost::asio::post(stream.get_executor(),
                      [handler = std::forward<Handler>(handler)]() mutable {
                        handler(boost::asio::error::message_size);
                      });
    return;
  }
  auto hdr = std::make_shared<std::array<uint8_t, kLengthHeaderSize>>(*header);
  const std::array<boost::asio::const_buffer, 2> bufs{boost::asio::buffer(*hdr),
                                                      boost::asio::buffer(*payload)};
  boost::asio::async_write(
      stream,
      bufs,
      [hdr, payload, handler = std::forward<Handler>(handler)](const boost::system::error_code& ec,
                                                               std::size_t) mutable {
        handler(ec);
      });
}

// Client side, step 3-4.
template <class AsyncReadStream, class Handler>
inline void async_read_length_header(AsyncReadStream& stream, Handler&& handler) {
  auto hdr = std::make_shared<std::array<uint8_t, kLengthHeaderSize>>();
  boost::asio::async_read(
      stream,
      boost::asio::buffer(*hdr),
      [hdr, handler = std::forward<Handler>(handler)](const boost::system::error_code& ec,
                                                      std::size_t) mutable {
        if (ec) return handler(ec, uint32_t{0});
        handler(ec, read_u32_be(hdr->data()));
      });
}

// Client side, step 5. On error the partial bytes are dropped; only the count is reported.
template <class AsyncReadStream, class Handler>
inline void async_read_payload_body(AsyncReadStream& stream, uint32_t len, Handler&& handler) {
  auto body = std::make_shared<std::string>(len, '\0');
  boost::asio::async_read(
      stream,
      boost::asio::buffer(*body),
      [body, handler = std::forward<Handler>(handler)](const boost::system::error_code& ec,
                                                       std::size_t n) mutable {
        if (ec) return handler(ec, n, std::string{});
        handler(ec, n, std::move(*body));
      });
}

} // namespace wombat
