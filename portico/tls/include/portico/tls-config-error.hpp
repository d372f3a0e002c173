#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace portico {

// Error raised while resolving the transport security configuration of a server.
class TlsConfigError : public std::runtime_error {
 public:
  enum class Kind : uint8_t {
    InvalidMode,         // unknown trust mode value
    ServerCertificates,  // server certificate or private key could not be loaded
    NoClientCAs,         // mutual TLS without any client CA file
    ClientCaRead,        // a client CA file could not be read
    ClientCaParse        // a client CA file does not contain any usable PEM certificate
  };

  TlsConfigError(Kind kind, const std::string& what) : std::runtime_error(what), _kind(kind) {}

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

 private:
  Kind _kind;
};

}  // namespace portico
