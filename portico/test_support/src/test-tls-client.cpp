#include "portico/test-tls-client.hpp"

#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <csignal>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "portico/tls-raii.hpp"

namespace portico::test {

namespace {
constexpr int kIoTimeoutMs = 2000;

// A server aborting the handshake closes the socket, the next SSL_write must fail with EPIPE instead of
// killing the test binary.
void IgnoreSigPipe() {
  static const bool kIgnored = [] { return std::signal(SIGPIPE, SIG_IGN) != SIG_ERR; }();
  static_cast<void>(kIgnored);
}
}  // namespace

TlsClient::TlsClient(uint16_t port, Options options) : _opts(std::move(options)), _cnx(port) {
  IgnoreSigPipe();
  _ctx = MakeSslCtx(::SSL_CTX_new(::TLS_client_method()));
  ::SSL_CTX_set_verify(_ctx.get(), SSL_VERIFY_NONE, nullptr);
  if (!_opts.clientCertPem.empty() && !_opts.clientKeyPem.empty()) {
    auto certBio = MakeMemBio(_opts.clientCertPem.data(), static_cast<int>(_opts.clientCertPem.size()));
    auto keyBio = MakeMemBio(_opts.clientKeyPem.data(), static_cast<int>(_opts.clientKeyPem.size()));
    X509Ptr cert(::PEM_read_bio_X509(certBio.get(), nullptr, nullptr, nullptr), ::X509_free);
    PKeyPtr pkey(::PEM_read_bio_PrivateKey(keyBio.get(), nullptr, nullptr, nullptr), ::EVP_PKEY_free);
    if (!cert || !pkey || ::SSL_CTX_use_certificate(_ctx.get(), cert.get()) != 1 ||
        ::SSL_CTX_use_PrivateKey(_ctx.get(), pkey.get()) != 1) {
      throw std::runtime_error("Invalid client certificate material");
    }
  }

  // Blocking socket with a receive timeout so that a silent server cannot hang a test.
  timeval tv{kIoTimeoutMs / 1000, (kIoTimeoutMs % 1000) * 1000};
  ::setsockopt(_cnx.fd(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  _ssl = MakeSsl(::SSL_new(_ctx.get()));
  ::SSL_set_fd(_ssl.get(), _cnx.fd());
  ::ERR_clear_error();
  if (::SSL_connect(_ssl.get()) == 1) {
    _handshakeOk = true;
  } else {
    recordError("SSL_connect");
  }
}

TlsClient::~TlsClient() {
  if (_handshakeOk && _lastError.empty()) {
    ::SSL_shutdown(_ssl.get());
  }
}

std::string TlsClient::exchange(std::string_view request) {
  if (!_handshakeOk) {
    return {};
  }
  std::size_t written = 0;
  if (::SSL_write_ex(_ssl.get(), request.data(), request.size(), &written) != 1 || written != request.size()) {
    recordError("SSL_write");
    return {};
  }
  std::string out;
  char buf[4096];
  while (true) {
    std::size_t nbRead = 0;
    if (::SSL_read_ex(_ssl.get(), buf, sizeof(buf), &nbRead) == 1) {
      out.append(buf, nbRead);
      if (parseResponse(out)) {
        break;
      }
      continue;
    }
    if (::SSL_get_error(_ssl.get(), 0) != SSL_ERROR_ZERO_RETURN) {
      recordError("SSL_read");
      if (!parseResponse(out)) {
        out.clear();
      }
    }
    break;
  }
  return out;
}

std::string TlsClient::get(std::string_view target) {
  return exchange(fmt::format("GET {} HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n", target));
}

std::string_view TlsClient::negotiatedVersion() const {
  return _handshakeOk ? std::string_view(::SSL_get_version(_ssl.get())) : std::string_view{};
}

void TlsClient::recordError(std::string_view operation) {
  _lastError = fmt::format("{} failed", operation);
  for (auto errVal = ::ERR_get_error(); errVal != 0; errVal = ::ERR_get_error()) {
    char errBuf[256];
    ::ERR_error_string_n(errVal, errBuf, sizeof(errBuf));
    _lastError.append(": ");
    _lastError.append(errBuf);
  }
}

}  // namespace portico::test
