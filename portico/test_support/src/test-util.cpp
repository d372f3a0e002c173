#include "portico/test-util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/format.h>

#include "portico/errno-throw.hpp"
#include "portico/http-constants.hpp"
#include "portico/socket.hpp"
#include "portico/string-utils.hpp"

namespace portico::test {

namespace {

constexpr std::size_t kChunkSize = 1 << 13;

std::chrono::milliseconds Remaining(std::chrono::steady_clock::time_point deadline) {
  const auto now = std::chrono::steady_clock::now();
  if (now >= deadline) {
    return 0ms;
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) + 1ms;
}

// Returns the number of bytes of the first response in 'raw' if it is complete, 0 otherwise.
std::size_t CompleteResponseSize(std::string_view raw) {
  const auto headerEnd = raw.find(http::DoubleCRLF);
  if (headerEnd == std::string_view::npos) {
    return 0;
  }
  const std::size_t bodyStart = headerEnd + http::DoubleCRLF.size();
  std::size_t contentLength = 0;
  std::string_view headers = raw.substr(0, headerEnd);
  while (!headers.empty()) {
    const auto lineEnd = headers.find(http::CRLF);
    const std::string_view line = headers.substr(0, lineEnd);
    const auto colon = line.find(':');
    if (colon != std::string_view::npos && CaseInsensitiveEqual(line.substr(0, colon), http::ContentLength)) {
      const auto value = TrimOws(line.substr(colon + 1));
      std::from_chars(value.data(), value.data() + value.size(), contentLength);
    }
    if (lineEnd == std::string_view::npos) {
      break;
    }
    headers.remove_prefix(lineEnd + http::CRLF.size());
  }
  return raw.size() >= bodyStart + contentLength ? bodyStart + contentLength : 0;
}

// Returns false on timeout.
bool WaitReadable(int fd, std::chrono::milliseconds timeout) {
  pollfd pfd{fd, POLLIN, 0};
  const int ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  return ret > 0;
}

}  // namespace

ClientConnection::ClientConnection(uint16_t port, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  while (true) {
    Socket sock(Socket::Type::Stream, AF_INET);
    if (::connect(sock.fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0) {
      _socket = std::move(sock);
      return;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      throw_errno("Unable to connect to 127.0.0.1:{}", port);
    }
    std::this_thread::sleep_for(5ms);
  }
}

std::optional<std::string_view> ParsedResponse::header(std::string_view name) const {
  for (const auto& [key, value] : headers) {
    if (CaseInsensitiveEqual(key, name)) {
      return std::string_view(value);
    }
  }
  return std::nullopt;
}

void sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout) {
  const auto deadline = std::chrono::steady_clock::now() + totalTimeout;
  while (!data.empty()) {
    const auto sent = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
    if (sent > 0) {
      data.remove_prefix(static_cast<std::size_t>(sent));
      continue;
    }
    if (sent == -1 && errno != EAGAIN && errno != EINTR) {
      throw_errno("send failed on fd # {}", fd);
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      throw std::runtime_error("sendAll timed out");
    }
    pollfd pfd{fd, POLLOUT, 0};
    ::poll(&pfd, 1, 1);
  }
}

std::string recvWithTimeout(int fd, std::chrono::milliseconds totalTimeout) {
  std::string out;
  const auto deadline = std::chrono::steady_clock::now() + totalTimeout;
  char buf[kChunkSize];
  while (CompleteResponseSize(out) == 0) {
    const auto remaining = Remaining(deadline);
    if (remaining == 0ms || !WaitReadable(fd, remaining)) {
      break;
    }
    const auto nbRead = ::recv(fd, buf, sizeof(buf), MSG_DONTWAIT);
    if (nbRead > 0) {
      out.append(buf, static_cast<std::size_t>(nbRead));
    } else if (nbRead == 0 || (errno != EAGAIN && errno != EINTR)) {
      break;
    }
  }
  return out;
}

std::string recvUntilClosed(int fd, std::chrono::milliseconds totalTimeout) {
  std::string out;
  const auto deadline = std::chrono::steady_clock::now() + totalTimeout;
  char buf[kChunkSize];
  while (true) {
    const auto remaining = Remaining(deadline);
    if (remaining == 0ms || !WaitReadable(fd, remaining)) {
      break;
    }
    const auto nbRead = ::recv(fd, buf, sizeof(buf), MSG_DONTWAIT);
    if (nbRead > 0) {
      out.append(buf, static_cast<std::size_t>(nbRead));
    } else if (nbRead == 0 || (errno != EAGAIN && errno != EINTR)) {
      break;
    }
  }
  return out;
}

bool WaitForPeerClose(int fd, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  char buf[kChunkSize];
  while (true) {
    const auto remaining = Remaining(deadline);
    if (remaining == 0ms || !WaitReadable(fd, remaining)) {
      return false;
    }
    const auto nbRead = ::recv(fd, buf, sizeof(buf), MSG_DONTWAIT);
    if (nbRead == 0 || (nbRead == -1 && errno != EAGAIN && errno != EINTR)) {
      return true;
    }
  }
}

std::string buildRequest(const RequestOptions& opt) {
  std::string req = fmt::format("{} {} HTTP/1.1\r\nHost: {}\r\n", opt.method, opt.target, opt.host);
  if (!opt.connection.empty()) {
    req.append(fmt::format("Connection: {}\r\n", opt.connection));
  }
  for (const auto& [name, value] : opt.headers) {
    req.append(fmt::format("{}: {}\r\n", name, value));
  }
  if (!opt.body.empty()) {
    req.append(fmt::format("Content-Length: {}\r\n", opt.body.size()));
  }
  req.append(http::CRLF);
  req.append(opt.body);
  return req;
}

std::optional<ParsedResponse> parseResponse(std::string_view raw) {
  const std::size_t totalSize = CompleteResponseSize(raw);
  if (totalSize == 0) {
    return std::nullopt;
  }
  const auto headerEnd = raw.find(http::DoubleCRLF);
  std::string_view head = raw.substr(0, headerEnd);

  ParsedResponse resp;
  const auto statusLineEnd = head.find(http::CRLF);
  const std::string_view statusLine = head.substr(0, statusLineEnd);
  // HTTP/1.1 200 OK
  const auto firstSpace = statusLine.find(' ');
  if (firstSpace == std::string_view::npos || statusLine.size() < firstSpace + 4) {
    return std::nullopt;
  }
  const auto codeStr = statusLine.substr(firstSpace + 1, 3);
  if (std::from_chars(codeStr.data(), codeStr.data() + codeStr.size(), resp.statusCode).ec != std::errc{}) {
    return std::nullopt;
  }
  if (statusLine.size() > firstSpace + 5) {
    resp.reason = statusLine.substr(firstSpace + 5);
  }

  head.remove_prefix(statusLineEnd == std::string_view::npos ? head.size() : statusLineEnd + http::CRLF.size());
  while (!head.empty()) {
    const auto lineEnd = head.find(http::CRLF);
    const std::string_view line = head.substr(0, lineEnd);
    const auto colon = line.find(':');
    if (colon != std::string_view::npos) {
      resp.headers.emplace_back(line.substr(0, colon), TrimOws(line.substr(colon + 1)));
    }
    if (lineEnd == std::string_view::npos) {
      break;
    }
    head.remove_prefix(lineEnd + http::CRLF.size());
  }
  const std::size_t bodyStart = headerEnd + http::DoubleCRLF.size();
  resp.body = raw.substr(bodyStart, totalSize - bodyStart);
  return resp;
}

ParsedResponse parseResponseOrThrow(std::string_view raw) {
  auto resp = parseResponse(raw);
  if (!resp) {
    throw std::runtime_error(fmt::format("Unable to parse HTTP response from {} byte(s)", raw.size()));
  }
  return *std::move(resp);
}

std::string requestOrThrow(uint16_t port, const RequestOptions& opt) {
  ClientConnection cnx(port);
  sendAll(cnx.fd(), buildRequest(opt));
  std::string raw = recvWithTimeout(cnx.fd(), opt.recvTimeout);
  if (raw.empty()) {
    throw std::runtime_error(fmt::format("No response received for {} {}", opt.method, opt.target));
  }
  return raw;
}

ParsedResponse fetch(uint16_t port, const RequestOptions& opt) { return parseResponseOrThrow(requestOrThrow(port, opt)); }

}  // namespace portico::test
