#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <thread>

#include "portico/server-config.hpp"
#include "portico/server-options.hpp"
#include "portico/server.hpp"
#include "portico/socket.hpp"

namespace portico::test {

// Plain HTTP configuration for tests: IPv4 loopback, ephemeral port, 2 reactors, short poll interval.
ServerConfig PlainTestConfig();

// RAII test harness running a Server on a background thread.
//  * The constructor starts run() and waits for the bound callback (no sleep, no connection polling)
//  * The destructor shuts the server down and joins the thread
//
// Usage:
//   TestServer ts(ServerOptions{}.withConfig(PlainTestConfig()).withEndpoints(...));
//   auto resp = fetch(ts.port());
class TestServer {
 public:
  // Throws std::runtime_error if the server did not bind within 'startTimeout', or rethrows the exception
  // thrown by run() before binding.
  explicit TestServer(ServerOptions options, std::chrono::milliseconds startTimeout = std::chrono::seconds{5});

  TestServer(const TestServer&) = delete;
  TestServer& operator=(const TestServer&) = delete;

  ~TestServer();

  [[nodiscard]] uint16_t port() const noexcept { return _address.port; }

  [[nodiscard]] const SocketAddress& address() const noexcept { return _address; }

  [[nodiscard]] Server& server() noexcept { return *_server; }

  // Shuts the server down and joins the serving thread. Rethrows the shutdown outcome.
  void stop(std::chrono::milliseconds maxWait = {});

  // Exception thrown by run(), if any. Only meaningful after stop().
  [[nodiscard]] std::exception_ptr runError() const noexcept { return _runError; }

 private:
  std::unique_ptr<Server> _server;
  SocketAddress _address;
  std::exception_ptr _runError;
  std::jthread _thread;
};

}  // namespace portico::test
