#pragma once

#include <cstdint>
#include <string>

namespace portico::test {

// In-memory PEM certificate material for tests. Nothing is written to disk.
struct CertKeyPem {
  std::string certPem;
  std::string keyPem;
};

enum class KeyAlgorithm : uint8_t { Rsa2048, EcdsaP256 };

// Self-signed leaf certificate (server side of most tests). Default is RSA 2048-bit, 1h validity.
CertKeyPem MakeEphemeralCertKey(const char* commonName = "localhost", int validSeconds = 3600,
                                KeyAlgorithm alg = KeyAlgorithm::Rsa2048);

// Self-signed certificate authority (basicConstraints CA:TRUE).
CertKeyPem MakeCertificateAuthority(const char* commonName = "portico test CA", int validSeconds = 3600);

// Leaf certificate issued and signed by 'issuer' (typically a client certificate for mutual TLS).
CertKeyPem MakeSignedCertKey(const CertKeyPem& issuer, const char* commonName = "client", int validSeconds = 3600,
                             KeyAlgorithm alg = KeyAlgorithm::EcdsaP256);

}  // namespace portico::test
