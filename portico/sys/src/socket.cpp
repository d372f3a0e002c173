#include "portico/socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "portico/base-fd.hpp"
#include "portico/errno-throw.hpp"
#include "portico/log.hpp"

namespace portico {

namespace {

constexpr int kListenBacklog = SOMAXCONN;

int ToSocketType(Socket::Type type) {
  switch (type) {
    case Socket::Type::Stream:
      return SOCK_STREAM | SOCK_CLOEXEC;
    case Socket::Type::StreamNonBlock:
      return SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK;
    default:
      throw std::invalid_argument("Invalid socket type");
  }
}

SocketAddress FromSockAddr(const sockaddr_storage& storage) {
  SocketAddress address;
  char buf[INET6_ADDRSTRLEN]{};
  if (storage.ss_family == AF_INET6) {
    const auto& sin6 = reinterpret_cast<const sockaddr_in6&>(storage);
    ::inet_ntop(AF_INET6, &sin6.sin6_addr, buf, sizeof(buf));
    address.port = ntohs(sin6.sin6_port);
  } else {
    const auto& sin = reinterpret_cast<const sockaddr_in&>(storage);
    ::inet_ntop(AF_INET, &sin.sin_addr, buf, sizeof(buf));
    address.port = ntohs(sin.sin_port);
  }
  address.ip = buf;
  return address;
}

}  // namespace

std::string SocketAddress::toString() const {
  if (ip.find(':') != std::string::npos) {
    return fmt::format("[{}]:{}", ip, port);
  }
  return fmt::format("{}:{}", ip, port);
}

Socket::Socket(Type type, int family) : _baseFd(::socket(family, ToSocketType(type), 0)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

Socket Socket::OpenListener(std::string_view bindIp, uint16_t port) {
  // inet_pton needs a null terminated string.
  const std::string ip(bindIp);

  sockaddr_storage storage{};
  socklen_t addrLen = 0;
  int family = AF_INET;
  if (auto& sin = reinterpret_cast<sockaddr_in&>(storage); ::inet_pton(AF_INET, ip.c_str(), &sin.sin_addr) == 1) {
    sin.sin_family = AF_INET;
    sin.sin_port = htons(port);
    addrLen = sizeof(sockaddr_in);
  } else if (auto& sin6 = reinterpret_cast<sockaddr_in6&>(storage);
             ::inet_pton(AF_INET6, ip.c_str(), &sin6.sin6_addr) == 1) {
    sin6.sin6_family = AF_INET6;
    sin6.sin6_port = htons(port);
    addrLen = sizeof(sockaddr_in6);
    family = AF_INET6;
  } else {
    throw std::invalid_argument(fmt::format("failed to resolve the TCP address (invalid IP address '{}')", bindIp));
  }

  Socket sock(Type::StreamNonBlock, family);

  static constexpr int kEnable = 1;
  if (::setsockopt(sock.fd(), SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) != 0) {
    throw_errno("setsockopt(SO_REUSEADDR) failed");
  }
  if (family == AF_INET6 && ::setsockopt(sock.fd(), IPPROTO_IPV6, IPV6_V6ONLY, &kEnable, sizeof(kEnable)) != 0) {
    throw_errno("setsockopt(IPV6_V6ONLY) failed");
  }
  if (::bind(sock.fd(), reinterpret_cast<const sockaddr*>(&storage), addrLen) != 0) {
    throw_errno("failed to listen on the TCP address ({}): bind", SocketAddress{ip, port}.toString());
  }
  if (::listen(sock.fd(), kListenBacklog) != 0) {
    throw_errno("failed to listen on the TCP address ({}): listen", SocketAddress{ip, port}.toString());
  }
  return sock;
}

SocketAddress Socket::localAddress() const {
  sockaddr_storage storage{};
  socklen_t addrLen = sizeof(storage);
  if (::getsockname(fd(), reinterpret_cast<sockaddr*>(&storage), &addrLen) != 0) {
    throw_errno("getsockname failed (fd # {})", fd());
  }
  return FromSockAddr(storage);
}

void Socket::shutdownListening() const noexcept {
  if (::shutdown(fd(), SHUT_RDWR) != 0) {
    const auto err = errno;
    log::debug("shutdown of listening fd # {} failed: {}", fd(), std::strerror(err));
  }
}

}  // namespace portico
