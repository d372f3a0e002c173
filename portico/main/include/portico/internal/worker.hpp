#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>

#include "portico/event-fd.hpp"
#include "portico/event-loop.hpp"
#include "portico/http-request-parser.hpp"
#include "portico/http-status-code.hpp"
#include "portico/internal/connection-state.hpp"
#include "portico/internal/lifecycle.hpp"
#include "portico/internal/stats-counters.hpp"
#include "portico/route-dispatcher.hpp"
#include "portico/server-config.hpp"
#include "portico/timedef.hpp"
#include "portico/tls-context.hpp"

namespace portico::internal {

// One reactor thread of a Server.
// Each worker owns an epoll instance, a wakeup eventfd and the connections it accepted. All workers share
// the non-blocking listening socket (registered with EPOLLEXCLUSIVE so that a new peer wakes only one of
// them), the immutable route dispatcher and the TLS context.
class Worker {
 public:
  // Objects owned by the Server, outliving all its workers.
  struct Shared {
    const ServerConfig& config;
    const RouteDispatcher& dispatcher;
    // nullptr when the TLS mode is Off.
    const TlsContext* tlsContext;
    const Lifecycle& lifecycle;
    StatsCounters& stats;
  };

  // Throws std::system_error if the epoll instance or the wakeup eventfd cannot be created.
  Worker(const Shared& shared, int listenFd, uint32_t workerId);

  Worker(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker& operator=(Worker&&) = delete;

  ~Worker() = default;

  // Serves connections until the server stops (immediate close of all connections) or finishes draining
  // (in-flight requests are completed, connections forcibly closed at the drain deadline).
  // Throws std::system_error if the event loop fails.
  void run();

  // Interrupts a blocking poll. Safe to call from any thread.
  void wakeup() const noexcept { _wakeupFd.send(); }

  // Number of connections closed because the drain deadline expired. Read after run() has returned.
  [[nodiscard]] std::size_t nbForcedCloses() const noexcept { return _nbForcedCloses; }

  [[nodiscard]] uint32_t id() const noexcept { return _workerId; }

 private:
  using ConnectionMap = std::unordered_map<int, std::unique_ptr<ConnectionState>>;
  using ConnectionMapIt = ConnectionMap::iterator;

  void acceptNewConnections();

  void handleReadableClient(int fd);

  void handleWritableClient(int fd);

  // Returns true once the handshake is complete. Closes or waits otherwise.
  bool advanceTlsHandshake(ConnectionMapIt cnxIt);

  // Parses and answers all complete requests of the input buffer. Returns true if the connection should stop
  // reading (it will be closed once its output is flushed).
  bool processRequests(ConnectionMapIt cnxIt);

  void answerRequest(ConnectionState& state, HttpRequest& request);

  void emitSimpleError(ConnectionState& state, http::StatusCode statusCode);

  void flushOutbound(ConnectionMapIt cnxIt);

  void updateWritableInterest(ConnectionMapIt cnxIt, bool enable);

  void sweepConnections(SteadyTimePoint now);

  // Returns true when the worker is done draining.
  bool drainStep(SteadyTimePoint now);

  ConnectionMapIt closeConnection(ConnectionMapIt cnxIt);

  void closeAllConnections();

  Shared _shared;
  ParserLimits _parserLimits;
  EventLoop _eventLoop;
  EventFd _wakeupFd;
  ConnectionMap _connections;
  SteadyTimePoint _nextSweepTp;
  std::size_t _nbForcedCloses{0};
  int _listenFd;
  uint32_t _workerId;
  bool _listenerRegistered{false};
  bool _draining{false};
};

}  // namespace portico::internal
