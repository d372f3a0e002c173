#include "portico/internal/worker.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <memory>
#include <string>
#include <utility>

#include "portico/base-fd.hpp"
#include "portico/errno-throw.hpp"
#include "portico/event.hpp"
#include "portico/http-constants.hpp"
#include "portico/http-method.hpp"
#include "portico/http-request-parser.hpp"
#include "portico/http-request.hpp"
#include "portico/http-response.hpp"
#include "portico/http-status-code.hpp"
#include "portico/internal/connection-state.hpp"
#include "portico/log.hpp"
#include "portico/socket.hpp"
#include "portico/timedef.hpp"
#include "portico/tls-transport.hpp"
#include "portico/transport.hpp"

namespace portico::internal {

namespace {

constexpr std::size_t kReadChunkBytes = 16UL * 1024UL;

constexpr EventBmp kClientEvents = EventIn | EventRdHup | EventEt;

}  // namespace

Worker::Worker(const Shared& shared, int listenFd, uint32_t workerId)
    : _shared(shared),
      _parserLimits{shared.config.maxHeaderBytes, shared.config.maxBodyBytes},
      _eventLoop(shared.config.pollInterval),
      _listenFd(listenFd),
      _workerId(workerId) {
  _eventLoop.addOrThrow(_wakeupFd.fd(), EventIn);
  _eventLoop.addOrThrow(_listenFd, EventIn | EventExclusive);
  _listenerRegistered = true;
}

void Worker::run() {
  log::debug("Worker #{} started", _workerId);
  while (true) {
    for (const auto& event : _eventLoop.poll()) {
      if (event.fd == _listenFd) {
        if (_shared.lifecycle.acceptingConnections()) {
          acceptNewConnections();
        }
      } else if (event.fd == _wakeupFd.fd()) {
        _wakeupFd.read();
      } else {
        if ((event.eventBmp & EventOut) != 0) {
          handleWritableClient(event.fd);
        }
        // EPOLLERR/EPOLLHUP/EPOLLRDHUP can be delivered without EPOLLIN.
        // Treat them as a read trigger so that EOF and errors are observed promptly.
        if ((event.eventBmp & (EventIn | EventErr | EventHup | EventRdHup)) != 0) {
          handleReadableClient(event.fd);
        }
      }
    }

    const auto now = SteadyClock::now();
    if (now >= _nextSweepTp) {
      sweepConnections(now);
      _nextSweepTp = now + _shared.config.pollInterval;
    }

    const auto state = _shared.lifecycle.current();
    if (state == Lifecycle::State::Stopped) {
      closeAllConnections();
      break;
    }
    if (state == Lifecycle::State::Draining && drainStep(now)) {
      break;
    }
  }
  log::debug("Worker #{} stopped", _workerId);
}

void Worker::acceptNewConnections() {
  while (true) {
    const int cnxFd = ::accept4(_listenFd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (cnxFd == BaseFd::kClosedFd) {
      const auto err = errno;
      if (err == EINTR || err == ECONNABORTED) {
        continue;
      }
      if (err == EAGAIN || !_shared.lifecycle.acceptingConnections()) {
        // no more waiting connections, or listener shut down by a concurrent drain
        break;
      }
      if (err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM) {
        log::error("Worker #{} cannot accept new connections: {}", _workerId, std::strerror(err));
        break;
      }
      throw_errno("accept4 failed on listening fd # {}", _listenFd);
    }

    Socket sock(BaseFd{cnxFd});

    static constexpr int kEnable = 1;
    if (::setsockopt(cnxFd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) != 0) {
      const auto err = errno;
      log::error("setsockopt(TCP_NODELAY) failed for fd # {}: {}", cnxFd, std::strerror(err));
    }

    std::unique_ptr<ITransport> transport;
    if (_shared.tlsContext != nullptr) {
      try {
        transport = std::make_unique<TlsTransport>(_shared.tlsContext->newConnection(cnxFd));
      } catch (const std::exception& ex) {
        log::error("Cannot create TLS session for fd # {}: {}", cnxFd, ex.what());
        continue;
      }
    } else {
      transport = std::make_unique<PlainTransport>(cnxFd);
    }

    if (!_eventLoop.add(cnxFd, kClientEvents)) {
      continue;
    }

    _shared.stats.connectionsAccepted.fetch_add(1, std::memory_order_relaxed);
    _connections.emplace(cnxFd,
                         std::make_unique<ConnectionState>(std::move(sock), std::move(transport), SteadyClock::now()));
    log::debug("Worker #{} accepted connection fd # {}", _workerId, cnxFd);
  }
}

bool Worker::advanceTlsHandshake(ConnectionMapIt cnxIt) {
  ConnectionState& state = *cnxIt->second;
  const auto hint = state.transport->handshake();
  if (state.transport->handshakeDone()) {
    state.tlsEstablished = true;
    state.tlsInfo = state.tlsTransport->sessionInfo();
    _shared.stats.tlsHandshakesSucceeded.fetch_add(1, std::memory_order_relaxed);
    log::debug("TLS handshake completed on fd # {} ({}, {}, client '{}')", cnxIt->first, state.tlsInfo.version,
               state.tlsInfo.cipher, state.tlsInfo.peerSubject);
    updateWritableInterest(cnxIt, false);
    return true;
  }
  switch (hint) {
    case TransportHint::Error:
      _shared.stats.tlsHandshakesFailed.fetch_add(1, std::memory_order_relaxed);
      log::debug("TLS handshake failed on fd # {}: {}", cnxIt->first, state.tlsTransport->lastError());
      closeConnection(cnxIt);
      break;
    case TransportHint::WriteReady:
      updateWritableInterest(cnxIt, true);
      break;
    default:
      break;
  }
  return false;
}

void Worker::handleReadableClient(int fd) {
  const auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) {
    return;
  }
  ConnectionState& state = *cnxIt->second;
  const auto now = SteadyClock::now();
  state.lastActivity = now;

  if (!state.tlsEstablished && !advanceTlsHandshake(cnxIt)) {
    return;
  }

  // TLS may need to read before a pending write can progress.
  if (state.hasPendingOutput()) {
    flushOutbound(cnxIt);
  }

  bool stopReading = state.closeAfterFlush || state.closeImmediately;
  while (!stopReading) {
    const auto [bytesRead, want] = state.transportRead(kReadChunkBytes);
    if (want == TransportHint::Error) {
      log::debug("Read error on fd # {}: {}", fd, std::strerror(errno));
      state.requestImmediateClose();
      break;
    }
    if (want != TransportHint::None) {
      if (want == TransportHint::WriteReady) {
        updateWritableInterest(cnxIt, true);
      }
      break;
    }
    if (bytesRead == 0) {
      // Orderly close by the peer: answer what has been fully received, then close.
      processRequests(cnxIt);
      state.closeAfterFlush = true;
      break;
    }
    if (!state.isRequestPending()) {
      state.requestStartTp = now;
    }
    stopReading = processRequests(cnxIt);
  }

  if (state.hasPendingOutput() && !state.closeImmediately) {
    flushOutbound(cnxIt);
  }
  if (state.canCloseNow()) {
    closeConnection(cnxIt);
  }
}

void Worker::handleWritableClient(int fd) {
  const auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) {
    return;
  }
  ConnectionState& state = *cnxIt->second;
  if (!state.tlsEstablished) {
    // The handshake needed to write. Resume it through the read path, which also consumes any
    // application data already received.
    handleReadableClient(fd);
    return;
  }
  flushOutbound(cnxIt);
  if (state.canCloseNow()) {
    closeConnection(cnxIt);
  }
}

bool Worker::processRequests(ConnectionMapIt cnxIt) {
  ConnectionState& state = *cnxIt->second;
  while (!state.inBuffer.empty() && !state.closeAfterFlush && !state.closeImmediately) {
    HttpRequest request;
    const auto result = ParseHttpRequest(state.inBuffer, _parserLimits, request, &state.chunkedProgress);
    if (result.status == ParseResult::Status::NeedMore) {
      state.headersComplete = result.headersComplete;
      if (result.expectContinue && !state.continueSent) {
        state.prepareOutput(SteadyClock::now()).append(http::HTTP11_100_CONTINUE);
        state.continueSent = true;
      }
      break;
    }
    if (result.status == ParseResult::Status::Error) {
      log::debug("Invalid request on fd # {}, answering {}", cnxIt->first, result.errorCode);
      emitSimpleError(state, result.errorCode);
      break;
    }

    state.inBuffer.erase(0, result.consumed);
    state.chunkedProgress = {};
    state.headersComplete = false;
    state.continueSent = false;
    // Bytes left in the buffer belong to the next pipelined request.
    state.requestStartTp = state.inBuffer.empty() ? SteadyTimePoint{} : SteadyClock::now();

    answerRequest(state, request);
  }
  return state.closeAfterFlush || state.closeImmediately;
}

void Worker::answerRequest(ConnectionState& state, HttpRequest& request) {
  if (state.tlsTransport != nullptr) {
    request.setTlsInfo(state.tlsInfo.version, state.tlsInfo.cipher, state.tlsInfo.peerSubject);
  }
  ++state.nbRequestsServed;

  const ServerConfig& config = _shared.config;
  bool keepAlive = config.enableKeepAlive && request.keepAliveRequested() &&
                   (config.maxRequestsPerConnection == 0 || state.nbRequestsServed < config.maxRequestsPerConnection);

  HttpResponse response;
  try {
    response = _shared.dispatcher.dispatch(request);
  } catch (const std::exception& ex) {
    log::error("Exception in handler of {} {}: {}", http::MethodToStr(request.method()), request.path(), ex.what());
    response = HttpResponse(http::StatusCodeInternalServerError);
    response.body(std::string(http::ReasonInternalServerError));
  }
  // Checked after the handler: a drain may have started while it was running.
  if (response.closeRequested() || !_shared.lifecycle.acceptingConnections()) {
    keepAlive = false;
  }

  response.serialize(state.prepareOutput(SteadyClock::now()), request.method() == http::Method::HEAD, !keepAlive);
  _shared.stats.requestsServed.fetch_add(1, std::memory_order_relaxed);

  if (!keepAlive) {
    state.closeAfterFlush = true;
    state.inBuffer.clear();
    state.chunkedProgress = {};
    state.requestStartTp = {};
  }
}

void Worker::emitSimpleError(ConnectionState& state, http::StatusCode statusCode) {
  HttpResponse response(statusCode);
  response.body(std::string(response.reason()));
  response.serialize(state.prepareOutput(SteadyClock::now()), false, true);
  state.closeAfterFlush = true;
  state.inBuffer.clear();
  state.chunkedProgress = {};
  state.requestStartTp = {};
}

void Worker::flushOutbound(ConnectionMapIt cnxIt) {
  ConnectionState& state = *cnxIt->second;
  while (state.hasPendingOutput()) {
    const auto [written, want] = state.transportWrite();
    if (want == TransportHint::Error) {
      log::debug("Write error on fd # {}: {}", cnxIt->first, std::strerror(errno));
      state.requestImmediateClose();
      return;
    }
    if (want != TransportHint::None) {
      if (want == TransportHint::WriteReady) {
        updateWritableInterest(cnxIt, true);
      }
      return;
    }
    if (written == 0) {
      break;
    }
  }
  if (!state.hasPendingOutput()) {
    state.lastActivity = SteadyClock::now();
    updateWritableInterest(cnxIt, false);
  }
}

void Worker::updateWritableInterest(ConnectionMapIt cnxIt, bool enable) {
  ConnectionState& state = *cnxIt->second;
  if (state.waitingWritable == enable) {
    return;
  }
  if (!_eventLoop.mod(cnxIt->first, enable ? (kClientEvents | EventOut) : kClientEvents)) {
    state.requestImmediateClose();
    return;
  }
  state.waitingWritable = enable;
}

void Worker::sweepConnections(SteadyTimePoint now) {
  // Timeouts need a periodic check: a client that stalls produces no further event.
  const ServerConfig& config = _shared.config;
  const auto headerReadTimeout = config.effectiveHeaderReadTimeout();
  const auto idleTimeout = config.effectiveIdleTimeout();

  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    ConnectionState& state = *cnxIt->second;

    if (state.canCloseNow()) {
      cnxIt = closeConnection(cnxIt);
      continue;
    }

    if (!state.tlsEstablished) {
      if (headerReadTimeout.count() > 0 && now > state.acceptTp + headerReadTimeout) {
        log::debug("TLS handshake timeout on fd # {}", cnxIt->first);
        _shared.stats.tlsHandshakesFailed.fetch_add(1, std::memory_order_relaxed);
        _shared.stats.connectionsTimedOut.fetch_add(1, std::memory_order_relaxed);
        cnxIt = closeConnection(cnxIt);
        continue;
      }
    } else if (state.hasPendingOutput()) {
      if (config.writeTimeout.count() > 0 && now > state.writeStartTp + config.writeTimeout) {
        log::debug("Write timeout on fd # {}", cnxIt->first);
        _shared.stats.connectionsTimedOut.fetch_add(1, std::memory_order_relaxed);
        cnxIt = closeConnection(cnxIt);
        continue;
      }
    } else if (state.isRequestPending()) {
      const bool headerExpired =
          !state.headersComplete && headerReadTimeout.count() > 0 && now > state.requestStartTp + headerReadTimeout;
      const bool readExpired = config.readTimeout.count() > 0 && now > state.requestStartTp + config.readTimeout;
      if (headerExpired || readExpired) {
        log::debug("{} timeout on fd # {}", headerExpired ? "Header read" : "Read", cnxIt->first);
        _shared.stats.connectionsTimedOut.fetch_add(1, std::memory_order_relaxed);
        emitSimpleError(state, http::StatusCodeRequestTimeout);
        flushOutbound(cnxIt);
        cnxIt = closeConnection(cnxIt);
        continue;
      }
    } else if (idleTimeout.count() > 0 && now > state.lastActivity + idleTimeout) {
      log::debug("Idle timeout on fd # {}", cnxIt->first);
      _shared.stats.connectionsTimedOut.fetch_add(1, std::memory_order_relaxed);
      cnxIt = closeConnection(cnxIt);
      continue;
    }
    ++cnxIt;
  }
}

bool Worker::drainStep(SteadyTimePoint now) {
  if (!_draining) {
    _draining = true;
    if (_listenerRegistered) {
      _eventLoop.del(_listenFd);
      _listenerRegistered = false;
    }
    if (!_connections.empty()) {
      log::debug("Worker #{} draining {} connection(s)", _workerId, _connections.size());
    }
  }

  // Idle connections (including those still in TLS handshake) are closed right away, the others once their
  // current request has been answered.
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    if (cnxIt->second->isIdle() || cnxIt->second->canCloseNow()) {
      cnxIt = closeConnection(cnxIt);
    } else {
      ++cnxIt;
    }
  }

  if (_connections.empty()) {
    return true;
  }

  if (_shared.lifecycle.hasDeadline() && now >= _shared.lifecycle.deadline()) {
    _nbForcedCloses = _connections.size();
    log::warn("Drain deadline reached with {} active connection(s) on worker #{}; forcing close", _nbForcedCloses,
              _workerId);
    _shared.stats.connectionsForciblyClosed.fetch_add(_nbForcedCloses, std::memory_order_relaxed);
    closeAllConnections();
    return true;
  }
  return false;
}

Worker::ConnectionMapIt Worker::closeConnection(ConnectionMapIt cnxIt) {
  const int fd = cnxIt->first;
  _eventLoop.del(fd);

  ConnectionState& state = *cnxIt->second;
  if (state.tlsTransport != nullptr && state.tlsEstablished) {
    // Best-effort close_notify
    state.transport->shutdown();
  }
  log::debug("Worker #{} closing connection fd # {}", _workerId, fd);
  return _connections.erase(cnxIt);
}

void Worker::closeAllConnections() {
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    cnxIt = closeConnection(cnxIt);
  }
}

}  // namespace portico::internal
