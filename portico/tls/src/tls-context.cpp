#include "portico/tls-context.hpp"

#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <fmt/format.h>

#include <fstream>
#include <iterator>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>

#include "portico/log.hpp"
#include "portico/tls-config-error.hpp"
#include "portico/tls-mode.hpp"
#include "portico/tls-raii.hpp"

namespace portico {

namespace {

constexpr unsigned char kSessionIdContext[] = "portico";

// Pops the whole OpenSSL error queue of the calling thread into a single line.
std::string DrainOpenSslErrors() {
  std::string out;
  for (auto errVal = ::ERR_get_error(); errVal != 0; errVal = ::ERR_get_error()) {
    char errBuf[256];
    ::ERR_error_string_n(errVal, errBuf, sizeof(errBuf));
    if (!out.empty()) {
      out.append("; ");
    }
    out.append(errBuf);
  }
  if (out.empty()) {
    out = "unknown OpenSSL error";
  }
  return out;
}

[[noreturn]] void ThrowServerCertificates(std::string_view detail) {
  throw TlsConfigError(TlsConfigError::Kind::ServerCertificates,
                       fmt::format("failed to load the server certificates ({})", detail));
}

SslCtxPtr NewServerCtx() {
  auto ctx = MakeSslCtx(::SSL_CTX_new(::TLS_server_method()));
  if (::SSL_CTX_set_min_proto_version(ctx.get(), TLS1_3_VERSION) != 1) {
    throw std::runtime_error(fmt::format("Failed to set minimum TLS version ({})", DrainOpenSslErrors()));
  }
  ::SSL_CTX_set_options(ctx.get(), SSL_OP_NO_COMPRESSION | SSL_OP_NO_RENEGOTIATION);
  ::SSL_CTX_set_mode(ctx.get(), SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
  return ctx;
}

void LoadCertificateAndKey(SSL_CTX* ctx, const std::string& certFile, const std::string& keyFile) {
  ::ERR_clear_error();
  if (certFile.empty() || keyFile.empty()) {
    ThrowServerCertificates("certificate or key file path missing");
  }
  if (::SSL_CTX_use_certificate_chain_file(ctx, certFile.c_str()) != 1) {
    ThrowServerCertificates(fmt::format("could not load certificate file '{}': {}", certFile, DrainOpenSslErrors()));
  }
  if (::SSL_CTX_use_PrivateKey_file(ctx, keyFile.c_str(), SSL_FILETYPE_PEM) != 1) {
    ThrowServerCertificates(fmt::format("could not load private key file '{}': {}", keyFile, DrainOpenSslErrors()));
  }
  if (::SSL_CTX_check_private_key(ctx) != 1) {
    ThrowServerCertificates(fmt::format("private key '{}' does not match certificate '{}': {}", keyFile, certFile,
                                        DrainOpenSslErrors()));
  }
}

[[noreturn]] void ThrowClientCa(TlsConfigError::Kind kind, std::string_view detail) {
  throw TlsConfigError(kind, fmt::format("failed to load client CA certificates ({})", detail));
}

// Adds every PEM certificate of caFile to the trust store and to the CA names advertised to clients.
void AppendClientCa(SSL_CTX* ctx, const std::string& caFile) {
  std::ifstream in(caFile, std::ios::binary);
  if (!in) {
    ThrowClientCa(TlsConfigError::Kind::ClientCaRead,
                  fmt::format("could not read client CA certificate on path {}", caFile));
  }
  const std::string pem{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  if (in.bad()) {
    ThrowClientCa(TlsConfigError::Kind::ClientCaRead,
                  fmt::format("could not read client CA certificate on path {}", caFile));
  }

  auto bio = MakeMemBio(pem.data(), static_cast<int>(pem.size()));
  X509_STORE* store = ::SSL_CTX_get_cert_store(ctx);
  int nbAppended = 0;
  while (true) {
    X509Ptr cert(::PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr), ::X509_free);
    if (!cert) {
      break;
    }
    if (::X509_STORE_add_cert(store, cert.get()) != 1 || ::SSL_CTX_add_client_CA(ctx, cert.get()) != 1) {
      ThrowClientCa(TlsConfigError::Kind::ClientCaParse,
                    fmt::format("failed to append client CA certificate ({}): {}", caFile, DrainOpenSslErrors()));
    }
    ++nbAppended;
  }
  // Reaching the end of the PEM data also leaves a 'no start line' error in the queue.
  ::ERR_clear_error();
  if (nbAppended == 0) {
    ThrowClientCa(TlsConfigError::Kind::ClientCaParse, fmt::format("failed to append client CA certificate ({})", caFile));
  }
  log::debug("Loaded {} client CA certificate(s) from {}", nbAppended, caFile);
}

}  // namespace

TlsContext::TlsContext(const std::string& certFile, const std::string& keyFile)
    : _ctx(NewServerCtx()), _mode(TlsMode::Tls) {
  LoadCertificateAndKey(_ctx.get(), certFile, keyFile);
  log::debug("TLS context ready (mode=tls, cert={})", certFile);
}

TlsContext::TlsContext(const std::string& certFile, const std::string& keyFile,
                       std::span<const std::string> clientCaFiles)
    : _ctx(nullptr, ::SSL_CTX_free), _mode(TlsMode::MutualTls) {
  // Checked before loading the server certificates.
  if (clientCaFiles.empty()) {
    throw TlsConfigError(TlsConfigError::Kind::NoClientCAs, "no client CAs provided");
  }
  _ctx = NewServerCtx();
  LoadCertificateAndKey(_ctx.get(), certFile, keyFile);
  for (const std::string& caFile : clientCaFiles) {
    AppendClientCa(_ctx.get(), caFile);
  }
  ::SSL_CTX_set_verify(_ctx.get(), SSL_VERIFY_PEER | SSL_VERIFY_FAIL_IF_NO_PEER_CERT, nullptr);
  // Required for session resumption when peer verification is enabled.
  ::SSL_CTX_set_session_id_context(_ctx.get(), kSessionIdContext, sizeof(kSessionIdContext) - 1);
  log::debug("TLS context ready (mode=mutual_tls, cert={}, nbClientCaFiles={})", certFile, clientCaFiles.size());
}

SslPtr TlsContext::newConnection(int fd) const {
  auto ssl = MakeSsl(::SSL_new(_ctx.get()));
  if (::SSL_set_fd(ssl.get(), fd) != 1) {
    throw std::runtime_error(fmt::format("SSL_set_fd failed for fd # {} ({})", fd, DrainOpenSslErrors()));
  }
  ::SSL_set_accept_state(ssl.get());
  return ssl;
}

std::shared_ptr<const TlsContext> ResolveTlsContext(TlsMode mode, const std::string& certFile,
                                                    const std::string& keyFile,
                                                    std::span<const std::string> clientCaFiles) {
  switch (mode) {
    case TlsMode::Off:
      return nullptr;
    case TlsMode::Tls:
      return std::make_shared<const TlsContext>(certFile, keyFile);
    case TlsMode::MutualTls:
      return std::make_shared<const TlsContext>(certFile, keyFile, clientCaFiles);
    default:
      throw TlsConfigError(TlsConfigError::Kind::InvalidMode,
                           fmt::format("invalid TLS mode: {}", static_cast<int>(mode)));
  }
}

}  // namespace portico
