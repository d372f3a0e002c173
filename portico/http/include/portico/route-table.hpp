#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "portico/http-method.hpp"
#include "portico/interceptor.hpp"

namespace portico {

// Handler entry of one (path, method) pair: its own interceptors (possibly none) and its terminal handler.
struct Endpoint {
  std::vector<Interceptor> interceptors;
  RequestHandler handler;
};

// Immutable mapping path -> method -> endpoint, produced by RouteTableBuilder::compile().
// It is shared read-only by all request handling threads.
class RouteTable {
  // Only RouteTableBuilder can construct a RouteTable.
  class PassKey {
    friend class RouteTableBuilder;
    PassKey() = default;
  };

 public:
  using MethodMap = std::map<http::Method, Endpoint>;
  using PathMap = std::map<std::string, MethodMap, std::less<>>;

  RouteTable(PassKey, PathMap routes) noexcept : _routes(std::move(routes)) {}

  [[nodiscard]] const PathMap& routes() const noexcept { return _routes; }

  // Returns the endpoint registered for this exact path pattern and method, or nullptr.
  [[nodiscard]] const Endpoint* find(std::string_view path, http::Method method) const noexcept;

  // Number of registered (path, method) pairs.
  [[nodiscard]] std::size_t nbEndpoints() const noexcept;

 private:
  friend class RouteTableBuilder;

  PathMap _routes;
};

// Write-once registry of endpoints. Registration errors are programming errors and are thrown
// as std::invalid_argument. Once compile() has been called, registering throws std::logic_error.
class RouteTableBuilder {
 public:
  // Registers 'endpoint' for 'path' and 'method'.
  // An endpoint without handler answers 501 Not Implemented.
  // Throws std::invalid_argument if the path is malformed or if the pair is already registered
  // (in which case the builder is left unchanged).
  RouteTableBuilder& registerEndpoint(std::string_view path, http::Method method, Endpoint endpoint = {});

  // Same as above, with the method given as a token (one of GET POST HEAD PUT PATCH DELETE CONNECT OPTIONS TRACE).
  RouteTableBuilder& registerEndpoint(std::string_view path, std::string_view method, Endpoint endpoint = {});

  // Shortcut for an endpoint without its own interceptors.
  RouteTableBuilder& registerEndpoint(std::string_view path, http::Method method, RequestHandler handler) {
    return registerEndpoint(path, method, Endpoint{{}, std::move(handler)});
  }

  // Freezes the builder and returns the table. Subsequent calls return the same table.
  std::shared_ptr<const RouteTable> compile();

  [[nodiscard]] bool isCompiled() const noexcept { return _compiledTable != nullptr; }

 private:
  RouteTable::PathMap _routes;
  std::shared_ptr<const RouteTable> _compiledTable;
};

// Implemented by components contributing endpoints to a server.
class EndpointProvider {
 public:
  virtual ~EndpointProvider() = default;

  // Called exactly once, during server construction.
  virtual void registerEndpoints(RouteTableBuilder& builder) = 0;
};

}  // namespace portico
