#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "portico/internal/lifecycle.hpp"
#include "portico/internal/run-tracker.hpp"
#include "portico/internal/stats-counters.hpp"
#include "portico/internal/worker.hpp"
#include "portico/route-dispatcher.hpp"
#include "portico/server-config.hpp"
#include "portico/server-options.hpp"
#include "portico/server-stats.hpp"
#include "portico/socket.hpp"
#include "portico/tls-context.hpp"

namespace portico {

// Embeddable HTTP/1.1 server, over plain TCP, TLS or mutual TLS.
//
// Lifecycle: Constructed -> Running -> Draining -> Stopped.
//  * The constructor loads the configuration, builds the routes from the endpoint providers and resolves the
//    TLS mode. Any failure is thrown, no half-initialized server is ever returned.
//  * run() opens the listener, reports its address to the bound callback, then serves from
//    config.nbWorkerThreads reactor threads until shutdown() is called. It can be called only once per instance.
//  * shutdown() stops accepting new connections, lets in-flight requests complete and waits for run() to return.
//    It is idempotent and can be called concurrently from any thread except a request handler.
//
// Usage:
//   Server server(ServerOptions{}
//                     .withConfig(ServerConfig{}.withTlsMode(TlsMode::Off))
//                     .withEndpoints([](RouteTableBuilder& builder) {
//                       builder.registerEndpoint("/", http::Method::GET,
//                                                [](const HttpRequest&) { return HttpResponse().body("PONG"); });
//                     }));
//   std::jthread serving([&server] { server.run(); });
//   ...
//   server.shutdown(std::chrono::seconds{5});
class Server {
 public:
  // Throws std::runtime_error "could not load configuration (...)" if the configuration provider fails or
  // produces an invalid configuration, std::invalid_argument for invalid endpoint registrations and
  // TlsConfigError if the TLS mode cannot be resolved.
  explicit Server(ServerOptions options);

  Server(const Server&) = delete;
  Server(Server&&) = delete;
  Server& operator=(const Server&) = delete;
  Server& operator=(Server&&) = delete;

  // Shuts the server down (without deadline) if it is running.
  ~Server();

  // Serves until shutdown() is called. Returns normally after a shutdown.
  // Throws:
  //  - std::logic_error if run() has already been called on this instance,
  //  - std::runtime_error "failed to create the network listener (...)" if the listener cannot be opened,
  //  - std::runtime_error "error encountered while serving http requests (...)" if serving stops for any
  //    other reason than a shutdown.
  // If shutdown() has been called before, the listener is opened and reported, and run() returns immediately.
  void run();

  // Gracefully stops the server and blocks until run() has returned.
  // Only the first call drains, with a deadline of 'maxWait' (0 means no deadline): the listener stops
  // accepting, idle connections are closed and in-flight requests are answered with "Connection: close".
  // Connections still open at the deadline are forcibly closed.
  // Every call, concurrent or later, returns the outcome of that single drain: nothing, or a
  // std::runtime_error "graceful drain deadline exceeded (...)".
  void shutdown(std::chrono::milliseconds maxWait = {});

  [[nodiscard]] const ServerConfig& config() const noexcept { return _config; }

  [[nodiscard]] bool isRunning() const noexcept { return _lifecycle.isRunning(); }

  [[nodiscard]] ServerStats stats() const noexcept { return _stats.snapshot(); }

 private:
  Socket openListener();

  void serve();

  void beginDrain(std::chrono::milliseconds maxWait);

  void recordServeError(const char* what);

  ServerConfig _config;
  ServerOptions::ListenerProvider _listenerProvider;
  ServerOptions::BoundCallback _boundCallback;
  RouteDispatcher _dispatcher;
  std::shared_ptr<const TlsContext> _tlsContext;

  internal::Lifecycle _lifecycle;
  internal::RunTracker _runTracker;
  internal::StatsCounters _stats;

  // Protects the members below, shared between run() and shutdown().
  std::mutex _mutex;
  Socket _listener;
  std::vector<std::unique_ptr<internal::Worker>> _workers;
  std::string _serveError;
  std::string _drainError;
};

}  // namespace portico
