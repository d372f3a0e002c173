#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

#include "portico/interceptor.hpp"
#include "portico/route-table.hpp"
#include "portico/server-config.hpp"
#include "portico/socket.hpp"

namespace portico {

// Construction inputs of a Server.
struct ServerOptions {
  // Produces the configuration of the server. Called once, by the Server constructor.
  using ConfigProvider = std::function<ServerConfig()>;

  // Opens the listening socket. It must return a non-blocking socket already listening.
  using ListenerProvider = std::function<Socket(std::string_view bindIp, uint16_t port)>;

  // Called once from run(), as soon as the listener is bound, with its local address.
  using BoundCallback = std::function<void(const SocketAddress&)>;

  // Adapter to register endpoints from a plain callable instead of an EndpointProvider implementation.
  using EndpointRegistrar = std::function<void(RouteTableBuilder&)>;

  ServerOptions& withConfigProvider(ConfigProvider provider);

  // Uses a fixed configuration.
  ServerOptions& withConfig(ServerConfig config);

  ServerOptions& withListenerProvider(ListenerProvider provider);

  ServerOptions& withBoundCallback(BoundCallback callback);

  // Replaces the interceptors applied to every endpoint, before the endpoint's own ones.
  ServerOptions& withCommonInterceptors(std::vector<Interceptor> interceptors);

  // Appends an interceptor to the common ones.
  ServerOptions& withCommonInterceptor(Interceptor interceptor);

  ServerOptions& withEndpointProvider(std::shared_ptr<EndpointProvider> provider);

  ServerOptions& withEndpoints(EndpointRegistrar registrar);

  ConfigProvider configProvider{&ServerConfig::FromEnv};
  ListenerProvider listenerProvider{&Socket::OpenListener};
  BoundCallback boundCallback;
  std::vector<Interceptor> commonInterceptors;
  std::vector<std::shared_ptr<EndpointProvider>> endpointProviders;
};

}  // namespace portico
