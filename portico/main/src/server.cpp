#include "portico/server.hpp"

#include <fmt/format.h>
#include <pthread.h>

#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "portico/internal/run-tracker.hpp"
#include "portico/internal/worker.hpp"
#include "portico/log.hpp"
#include "portico/route-dispatcher.hpp"
#include "portico/route-table.hpp"
#include "portico/server-config.hpp"
#include "portico/server-options.hpp"
#include "portico/socket.hpp"
#include "portico/timedef.hpp"
#include "portico/tls-context.hpp"
#include "portico/tls-mode.hpp"

namespace portico {

namespace {

ServerConfig LoadConfig(const ServerOptions::ConfigProvider& configProvider) {
  if (!configProvider) {
    throw std::runtime_error("could not load configuration (no configuration provider)");
  }
  try {
    ServerConfig config = configProvider();
    config.validate();
    return config;
  } catch (const std::exception& ex) {
    throw std::runtime_error(fmt::format("could not load configuration ({})", ex.what()));
  }
}

std::shared_ptr<const RouteTable> BuildRouteTable(const std::vector<std::shared_ptr<EndpointProvider>>& providers) {
  RouteTableBuilder builder;
  for (const auto& provider : providers) {
    if (provider) {
      provider->registerEndpoints(builder);
    }
  }
  return builder.compile();
}

// Broken pipes are reported through EPIPE by the transports. Reactor threads must not let a peer that went
// away kill the process, including for writes issued by OpenSSL.
void BlockSigPipeOnThisThread() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGPIPE);
  const int err = ::pthread_sigmask(SIG_BLOCK, &set, nullptr);
  if (err != 0) {
    log::warn("Unable to block SIGPIPE in reactor thread (error {})", err);
  }
}

}  // namespace

Server::Server(ServerOptions options)
    : _config(LoadConfig(options.configProvider)),
      _listenerProvider(options.listenerProvider ? std::move(options.listenerProvider)
                                                 : ServerOptions::ListenerProvider{&Socket::OpenListener}),
      _boundCallback(std::move(options.boundCallback)),
      _dispatcher(*BuildRouteTable(options.endpointProviders), options.commonInterceptors),
      _tlsContext(ResolveTlsContext(_config.tlsMode, _config.certFile, _config.keyFile, _config.clientCaFiles)) {
  log::debug("Server created with {} route(s), TLS mode '{}'", _dispatcher.nbRoutes(),
             TlsModeToString(_config.tlsMode));
}

Server::~Server() {
  try {
    shutdown();
  } catch (const std::exception& ex) {
    log::error("Error while shutting down server: {}", ex.what());
  }
}

Socket Server::openListener() {
  Socket listener;
  try {
    listener = _listenerProvider(_config.bindAddress, _config.port);
  } catch (const std::exception& ex) {
    throw std::runtime_error(fmt::format("failed to create the network listener ({})", ex.what()));
  }
  if (!listener) {
    throw std::runtime_error("failed to create the network listener (the listener provider returned no socket)");
  }
  return listener;
}

void Server::run() {
  if (!_lifecycle.tryMarkRan()) {
    throw std::logic_error("HTTP server can only be run once per instance");
  }
  internal::RunTrackerGuard runGuard(_runTracker);

  Socket listener = openListener();
  SocketAddress address;
  try {
    address = listener.localAddress();
  } catch (const std::exception& ex) {
    throw std::runtime_error(fmt::format("failed to create the network listener ({})", ex.what()));
  }

  log::info("HTTP server listening on {} (TLS mode '{}')", address.toString(), TlsModeToString(_config.tlsMode));
  if (_boundCallback) {
    _boundCallback(address);
  }

  {
    std::scoped_lock lock(_mutex);
    if (_lifecycle.isShutdownRequested()) {
      _lifecycle.enterStopped();
      log::info("HTTP server shut down before serving");
      return;
    }
    _listener = std::move(listener);
    try {
      const uint32_t nbWorkers = _config.effectiveNbWorkerThreads();
      const internal::Worker::Shared shared{_config, _dispatcher, _tlsContext.get(), _lifecycle, _stats};
      _workers.reserve(nbWorkers);
      for (uint32_t workerId = 0; workerId < nbWorkers; ++workerId) {
        _workers.push_back(std::make_unique<internal::Worker>(shared, _listener.fd(), workerId));
      }
    } catch (const std::exception& ex) {
      _workers.clear();
      _listener.close();
      _lifecycle.enterStopped();
      throw std::runtime_error(fmt::format("error encountered while serving http requests ({})", ex.what()));
    }
    _lifecycle.enterRunning();
  }

  serve();
}

void Server::serve() {
  {
    std::vector<std::jthread> threads;
    threads.reserve(_workers.size());
    try {
      for (auto& worker : _workers) {
        threads.emplace_back([this, pWorker = worker.get()] {
          BlockSigPipeOnThisThread();
          try {
            pWorker->run();
          } catch (const std::exception& ex) {
            log::error("Worker #{} failed: {}", pWorker->id(), ex.what());
            recordServeError(ex.what());
          }
        });
      }
    } catch (const std::exception& ex) {
      recordServeError(ex.what());
    }
    // joins all reactors
  }

  std::size_t nbForcedCloses = 0;
  for (const auto& worker : _workers) {
    nbForcedCloses += worker->nbForcedCloses();
  }

  std::string serveError;
  {
    std::scoped_lock lock(_mutex);
    _workers.clear();
    _listener.close();
    _lifecycle.enterStopped();
    if (nbForcedCloses != 0) {
      _drainError =
          fmt::format("graceful drain deadline exceeded ({} connection(s) forcibly closed)", nbForcedCloses);
    }
    serveError = std::move(_serveError);
  }
  log::info("HTTP server stopped");

  if (!serveError.empty()) {
    throw std::runtime_error(fmt::format("error encountered while serving http requests ({})", serveError));
  }
}

void Server::recordServeError(const char* what) {
  std::scoped_lock lock(_mutex);
  if (_serveError.empty()) {
    _serveError = what;
  }
  // A failing reactor stops the whole server.
  _lifecycle.enterStopped();
  for (const auto& worker : _workers) {
    worker->wakeup();
  }
}

void Server::shutdown(std::chrono::milliseconds maxWait) {
  if (_lifecycle.tryMarkShutdownRequested()) {
    beginDrain(maxWait);
  }

  // Every caller waits for the end of run(), then observes the outcome of the single drain.
  _runTracker.waitUntilAllFinished();

  std::string drainError;
  {
    std::scoped_lock lock(_mutex);
    drainError = _drainError;
  }
  if (!drainError.empty()) {
    throw std::runtime_error(drainError);
  }
}

void Server::beginDrain(std::chrono::milliseconds maxWait) {
  std::scoped_lock lock(_mutex);
  if (!_lifecycle.isRunning()) {
    // run() not called yet (it will return right after binding), or already stopped.
    log::debug("Shutdown requested while the server is not running");
    return;
  }
  _stats.drainsPerformed.fetch_add(1, std::memory_order_relaxed);

  const bool hasDeadline = maxWait.count() > 0;
  const auto deadline = hasDeadline ? SteadyClock::now() + maxWait : SteadyTimePoint{};

  log::info("Initiating graceful drain (deadline: {})",
            hasDeadline ? fmt::format("{} ms", maxWait.count()) : std::string("none"));

  _lifecycle.enterDraining(deadline, hasDeadline);
  _listener.shutdownListening();
  for (const auto& worker : _workers) {
    worker->wakeup();
  }
}

}  // namespace portico
