#include "portico/tls-transport.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <cerrno>
#include <cstddef>
#include <string>
#include <string_view>

#include "portico/log.hpp"
#include "portico/tls-raii.hpp"
#include "portico/transport.hpp"

namespace portico {

namespace {

constexpr bool IsRetry(int code) { return code == SSL_ERROR_WANT_READ || code == SSL_ERROR_WANT_WRITE; }

constexpr TransportHint RetryHint(int code) {
  return code == SSL_ERROR_WANT_WRITE ? TransportHint::WriteReady : TransportHint::ReadReady;
}

}  // namespace

TransportHint TlsTransport::handshake() {
  if (_handshakeDone) {
    return TransportHint::None;
  }
  ::ERR_clear_error();
  const int ret = ::SSL_do_handshake(_ssl.get());
  if (ret == 1) {
    _handshakeDone = true;
    return TransportHint::None;
  }
  const int err = ::SSL_get_error(_ssl.get(), ret);
  if (IsRetry(err)) {
    return RetryHint(err);
  }
  if (err == SSL_ERROR_SYSCALL && errno == EAGAIN) {
    return TransportHint::ReadReady;
  }
  recordError();
  return TransportHint::Error;
}

ITransport::TransportResult TlsTransport::read(char* buf, std::size_t len) {
  TransportResult ret{0, handshake()};
  if (ret.want != TransportHint::None) {
    return ret;
  }

  ::ERR_clear_error();
  if (::SSL_read_ex(_ssl.get(), buf, len, &ret.bytesProcessed) == 1) {
    return ret;
  }
  ret.bytesProcessed = 0;

  const int err = ::SSL_get_error(_ssl.get(), 0);
  if (err == SSL_ERROR_ZERO_RETURN) {
    // close_notify received
    return ret;
  }
  if (IsRetry(err)) {
    ret.want = RetryHint(err);
    return ret;
  }
  if (err == SSL_ERROR_SYSCALL && errno == EAGAIN) {
    ret.want = TransportHint::ReadReady;
    return ret;
  }
  recordError();
  ret.want = TransportHint::Error;
  return ret;
}

ITransport::TransportResult TlsTransport::write(std::string_view data) {
  TransportResult ret{0, handshake()};
  if (ret.want != TransportHint::None || data.empty()) {
    return ret;
  }

  while (ret.bytesProcessed < data.size()) {
    std::size_t written = 0;
    ::ERR_clear_error();
    if (::SSL_write_ex(_ssl.get(), data.data() + ret.bytesProcessed, data.size() - ret.bytesProcessed, &written) ==
        1) {
      ret.bytesProcessed += written;
      continue;
    }
    const int err = ::SSL_get_error(_ssl.get(), 0);
    if (IsRetry(err)) {
      ret.want = RetryHint(err);
    } else if (err == SSL_ERROR_SYSCALL && errno == EAGAIN) {
      ret.want = TransportHint::WriteReady;
    } else {
      recordError();
      ret.want = TransportHint::Error;
    }
    break;
  }
  return ret;
}

void TlsTransport::shutdown() noexcept {
  if (_handshakeDone) {
    ::SSL_shutdown(_ssl.get());
  }
  ::ERR_clear_error();
}

TlsSessionInfo TlsTransport::sessionInfo() const {
  TlsSessionInfo info;
  info.version = ::SSL_get_version(_ssl.get());
  if (const char* cipher = ::SSL_get_cipher_name(_ssl.get()); cipher != nullptr) {
    info.cipher = cipher;
  }
  X509Ptr peer(::SSL_get1_peer_certificate(_ssl.get()), ::X509_free);
  if (peer) {
    char buf[256];
    if (::X509_NAME_oneline(::X509_get_subject_name(peer.get()), buf, sizeof(buf)) != nullptr) {
      info.peerSubject = buf;
    }
  }
  return info;
}

void TlsTransport::recordError() {
  _lastError.clear();
  for (auto errVal = ::ERR_get_error(); errVal != 0; errVal = ::ERR_get_error()) {
    char errBuf[256];
    ::ERR_error_string_n(errVal, errBuf, sizeof(errBuf));
    if (!_lastError.empty()) {
      _lastError.append("; ");
    }
    _lastError.append(errBuf);
  }
  if (_lastError.empty()) {
    _lastError = "connection reset during TLS exchange";
  }
  log::debug("TLS transport error (handshake done={}): {}", _handshakeDone, _lastError);
}

}  // namespace portico
