#include "portico/test-server.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>

#include "portico/log.hpp"
#include "portico/server-config.hpp"
#include "portico/server-options.hpp"
#include "portico/server.hpp"
#include "portico/socket.hpp"
#include "portico/tls-mode.hpp"

namespace portico::test {

namespace {

struct BoundSignal {
  std::promise<SocketAddress> promise;
  std::atomic<bool> satisfied{false};
};

}  // namespace

ServerConfig PlainTestConfig() {
  return ServerConfig{}
      .withBindAddress("127.0.0.1")
      .withTlsMode(TlsMode::Off)
      .withNbWorkerThreads(2)
      .withPollInterval(std::chrono::milliseconds{10});
}

TestServer::TestServer(ServerOptions options, std::chrono::milliseconds startTimeout) {
  auto signal = std::make_shared<BoundSignal>();
  auto boundFuture = signal->promise.get_future();

  options.withBoundCallback([userCallback = std::move(options.boundCallback), signal](const SocketAddress& address) {
    if (userCallback) {
      userCallback(address);
    }
    if (!signal->satisfied.exchange(true)) {
      signal->promise.set_value(address);
    }
  });

  _server = std::make_unique<Server>(std::move(options));

  _thread = std::jthread([this, signal] {
    try {
      _server->run();
    } catch (const std::exception& ex) {
      log::debug("Test server run() failed: {}", ex.what());
      _runError = std::current_exception();
      if (!signal->satisfied.exchange(true)) {
        signal->promise.set_exception(_runError);
      }
    }
  });

  if (boundFuture.wait_for(startTimeout) != std::future_status::ready) {
    _server->shutdown();
    _thread.join();
    throw std::runtime_error("test server did not bind in time");
  }
  try {
    _address = boundFuture.get();
  } catch (const std::exception&) {
    _thread.join();
    throw;
  }
}

TestServer::~TestServer() {
  if (!_thread.joinable()) {
    return;
  }
  try {
    _server->shutdown();
  } catch (const std::exception& ex) {
    log::warn("Test server shutdown failed: {}", ex.what());
  }
  _thread.join();
}

void TestServer::stop(std::chrono::milliseconds maxWait) {
  std::exception_ptr shutdownError;
  try {
    _server->shutdown(maxWait);
  } catch (const std::exception&) {
    shutdownError = std::current_exception();
  }
  if (_thread.joinable()) {
    _thread.join();
  }
  if (shutdownError) {
    std::rethrow_exception(shutdownError);
  }
}

}  // namespace portico::test
