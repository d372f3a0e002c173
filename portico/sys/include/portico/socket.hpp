#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "portico/base-fd.hpp"

namespace portico {

// IP literal and port of a bound or connected socket.
struct SocketAddress {
  // "host:port", with brackets around IPv6 hosts ("[::1]:8080").
  [[nodiscard]] std::string toString() const;

  bool operator==(const SocketAddress&) const = default;

  std::string ip;
  uint16_t port{};
};

// RAII TCP socket.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Creates a new socket of the given address family (AF_INET or AF_INET6).
  // Throws std::system_error on failure.
  Socket(Type type, int family);

  // Adopts an already opened descriptor (typically returned by accept4).
  explicit Socket(BaseFd baseFd) noexcept : _baseFd(std::move(baseFd)) {}

  // Creates a non-blocking socket bound to bindIp:port and listening.
  // Port 0 selects an ephemeral port, retrievable with localAddress().
  // Throws std::invalid_argument if bindIp is not an IPv4 or IPv6 literal, std::system_error if the
  // socket cannot be bound (address in use, permission denied) or cannot listen.
  static Socket OpenListener(std::string_view bindIp, uint16_t port);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Throws std::system_error on failure.
  [[nodiscard]] SocketAddress localAddress() const;

  // Stops a listening socket from accepting: pending and future accept() calls fail, new peers are
  // refused. The descriptor itself stays open until close().
  void shutdownListening() const noexcept;

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace portico
