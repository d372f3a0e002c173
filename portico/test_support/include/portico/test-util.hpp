#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "portico/http-status-code.hpp"
#include "portico/socket.hpp"

namespace portico::test {
using namespace std::chrono_literals;

// Blocking IPv4 loopback client connection, retried until 'timeout' while the server starts.
class ClientConnection {
 public:
  ClientConnection() noexcept = default;

  // Throws std::system_error if no connection could be established in time.
  explicit ClientConnection(uint16_t port, std::chrono::milliseconds timeout = 1000ms);

  [[nodiscard]] int fd() const noexcept { return _socket.fd(); }

  void close() noexcept { _socket.close(); }

 private:
  Socket _socket;
};

// Minimal parsed HTTP/1.1 response for assertions.
struct ParsedResponse {
  // Case-insensitive header lookup.
  [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;

  http::StatusCode statusCode{0};
  std::string reason;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
};

struct RequestOptions {
  std::string method{"GET"};
  std::string target{"/"};
  std::string host{"localhost"};
  std::string connection{"close"};
  std::string body;
  std::vector<std::pair<std::string, std::string>> headers;
  std::chrono::milliseconds recvTimeout{2000ms};
};

void sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout = 1000ms);

// Reads until one complete response (headers + Content-Length body) is buffered, the peer closes,
// or the timeout expires.
std::string recvWithTimeout(int fd, std::chrono::milliseconds totalTimeout = 2000ms);

// Reads until the peer closes the connection or the timeout expires.
std::string recvUntilClosed(int fd, std::chrono::milliseconds totalTimeout = 2000ms);

// Returns true if the peer closed (orderly or reset) the connection within 'timeout'.
bool WaitForPeerClose(int fd, std::chrono::milliseconds timeout);

std::string buildRequest(const RequestOptions& opt);

// Parses the first response found in 'raw'. Returns std::nullopt if it is incomplete or malformed.
std::optional<ParsedResponse> parseResponse(std::string_view raw);

// Throws std::runtime_error if 'raw' does not start with a complete response.
ParsedResponse parseResponseOrThrow(std::string_view raw);

// Sends one request on a new connection and returns the raw response bytes.
// Throws std::runtime_error (or std::system_error) if nothing could be received.
std::string requestOrThrow(uint16_t port, const RequestOptions& opt = {});

// requestOrThrow + parseResponseOrThrow
ParsedResponse fetch(uint16_t port, const RequestOptions& opt = {});

}  // namespace portico::test
