#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace portico {

// What a non-blocking transport operation needs before it can make progress.
enum class TransportHint : uint8_t {
  None,        // operation completed (possibly partially, or orderly close for reads)
  ReadReady,   // wait for the socket to become readable
  WriteReady,  // wait for the socket to become writable
  Error
};

// Byte stream abstraction over a connected socket, either plain or TLS.
class ITransport {
 public:
  struct TransportResult {
    std::size_t bytesProcessed;
    TransportHint want;
  };

  ITransport() noexcept = default;
  ITransport(const ITransport&) = delete;
  ITransport& operator=(const ITransport&) = delete;

  virtual ~ITransport() = default;

  // Reads at most len bytes. {0, None} means the peer closed the connection.
  virtual TransportResult read(char* buf, std::size_t len) = 0;

  // Writes as much of data as possible without blocking.
  virtual TransportResult write(std::string_view data) = 0;

  // Advances a pending handshake. Plain transports have none.
  virtual TransportHint handshake() { return TransportHint::None; }

  [[nodiscard]] virtual bool handshakeDone() const noexcept { return true; }

  // Best effort orderly close notification, called before the socket is closed.
  virtual void shutdown() noexcept {}
};

class PlainTransport final : public ITransport {
 public:
  explicit PlainTransport(int fd) noexcept : _fd(fd) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

 private:
  int _fd;
};

}  // namespace portico
