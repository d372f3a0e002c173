#pragma once

#include <cstdint>
#include <string_view>

namespace portico {

// Transport security posture of a server.
//  - Off       : plain TCP, no certificate material needed.
//  - Tls       : server authenticated TLS, requires a certificate and private key.
//  - MutualTls : Tls plus mandatory verification of a client certificate issued by a configured CA.
enum class TlsMode : uint8_t { Off, Tls, MutualTls };

// Returns "off", "tls" or "mutual_tls".
std::string_view TlsModeToString(TlsMode mode);

// Parses "off", "tls" or "mutual_tls" (exact, lower case).
// Throws TlsConfigError of kind InvalidMode otherwise.
TlsMode TlsModeFromString(std::string_view value);

}  // namespace portico
