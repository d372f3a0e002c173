#pragma once

#include <memory>
#include <span>
#include <string>

#include "portico/tls-mode.hpp"
#include "portico/tls-raii.hpp"

namespace portico {

// Server side OpenSSL context for one of the two TLS trust modes.
// Both modes negotiate TLS 1.3 only. In MutualTls mode every connection must present a client
// certificate chaining to one of the configured CAs, otherwise the handshake fails.
// The context is immutable once constructed and can be shared by all connections and threads.
class TlsContext {
 public:
  // Server authenticated TLS. Throws TlsConfigError (ServerCertificates).
  TlsContext(const std::string& certFile, const std::string& keyFile);

  // Mutually authenticated TLS. Throws TlsConfigError (NoClientCAs, ServerCertificates, ClientCaRead, ClientCaParse).
  TlsContext(const std::string& certFile, const std::string& keyFile, std::span<const std::string> clientCaFiles);

  TlsContext(const TlsContext&) = delete;
  TlsContext(TlsContext&&) noexcept = default;
  TlsContext& operator=(const TlsContext&) = delete;
  TlsContext& operator=(TlsContext&&) noexcept = default;

  ~TlsContext() = default;

  [[nodiscard]] TlsMode mode() const noexcept { return _mode; }

  [[nodiscard]] SSL_CTX* raw() const noexcept { return _ctx.get(); }

  // Creates the server side SSL object of a freshly accepted connection, in accept state.
  // Throws std::bad_alloc or std::runtime_error.
  [[nodiscard]] SslPtr newConnection(int fd) const;

 private:
  SslCtxPtr _ctx;
  TlsMode _mode;
};

// Resolves the transport security configuration of a server.
// Returns nullptr for TlsMode::Off (cert/key/CA arguments are then ignored), a ready context otherwise.
// Throws TlsConfigError, including for a TlsMode value outside of the enumeration.
std::shared_ptr<const TlsContext> ResolveTlsContext(TlsMode mode, const std::string& certFile,
                                                    const std::string& keyFile,
                                                    std::span<const std::string> clientCaFiles);

}  // namespace portico
