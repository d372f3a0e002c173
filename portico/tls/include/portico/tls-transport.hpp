#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "portico/tls-raii.hpp"
#include "portico/transport.hpp"

namespace portico {

// Negotiated parameters of a completed handshake.
struct TlsSessionInfo {
  std::string version;
  std::string cipher;
  // One-line subject of the verified client certificate, empty when the client presented none.
  std::string peerSubject;
};

// Non-blocking TLS transport over an accepted socket (OpenSSL, server side).
// The handshake is driven explicitly through handshake(); read() and write() drive it implicitly
// if it is not complete yet.
class TlsTransport final : public ITransport {
 public:
  explicit TlsTransport(SslPtr ssl) noexcept : _ssl(std::move(ssl)) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

  TransportHint handshake() override;

  [[nodiscard]] bool handshakeDone() const noexcept override { return _handshakeDone; }

  // Sends close_notify without waiting for the peer's one.
  void shutdown() noexcept override;

  // Only meaningful once handshakeDone() is true.
  [[nodiscard]] TlsSessionInfo sessionInfo() const;

  // Last handshake failure reason reported by OpenSSL (empty if none).
  [[nodiscard]] std::string_view lastError() const noexcept { return _lastError; }

 private:
  void recordError();

  SslPtr _ssl;
  std::string _lastError;
  bool _handshakeDone{false};
};

}  // namespace portico
