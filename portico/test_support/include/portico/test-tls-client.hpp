#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "portico/test-util.hpp"
#include "portico/tls-raii.hpp"

namespace portico::test {

// Blocking OpenSSL client used by the TLS tests.
//  * Server certificate verification is disabled (tests use self-signed server certificates).
//  * An optional client certificate/key pair (PEM, in memory) is presented for mutual TLS.
// With TLS 1.3 the server verifies the client certificate after the client considers the handshake
// finished, so a rejected client typically sees handshakeOk() == true and then a failing exchange().
class TlsClient {
 public:
  struct Options {
    std::string clientCertPem;
    std::string clientKeyPem;
  };

  explicit TlsClient(uint16_t port) : TlsClient(port, Options{}) {}

  TlsClient(uint16_t port, Options options);

  TlsClient(const TlsClient&) = delete;
  TlsClient& operator=(const TlsClient&) = delete;

  ~TlsClient();

  [[nodiscard]] bool handshakeOk() const noexcept { return _handshakeOk; }

  // Sends 'request' and reads until the peer closes or a complete response is received.
  // Returns an empty string if the exchange failed (the reason is then available in lastError()).
  std::string exchange(std::string_view request);

  // GET 'target' with Connection: close. Empty on failure.
  std::string get(std::string_view target);

  [[nodiscard]] const std::string& lastError() const noexcept { return _lastError; }

  [[nodiscard]] std::string_view negotiatedVersion() const;

 private:
  void recordError(std::string_view operation);

  Options _opts;
  ClientConnection _cnx;
  SslCtxPtr _ctx{nullptr, ::SSL_CTX_free};
  SslPtr _ssl{nullptr, ::SSL_free};
  std::string _lastError;
  bool _handshakeOk{false};
};

}  // namespace portico::test
