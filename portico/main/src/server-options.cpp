#include "portico/server-options.hpp"

#include <memory>
#include <utility>
#include <vector>

#include "portico/interceptor.hpp"
#include "portico/route-table.hpp"
#include "portico/server-config.hpp"

namespace portico {

namespace {

class RegistrarEndpointProvider final : public EndpointProvider {
 public:
  explicit RegistrarEndpointProvider(ServerOptions::EndpointRegistrar registrar) : _registrar(std::move(registrar)) {}

  void registerEndpoints(RouteTableBuilder& builder) override { _registrar(builder); }

 private:
  ServerOptions::EndpointRegistrar _registrar;
};

}  // namespace

ServerOptions& ServerOptions::withConfigProvider(ConfigProvider provider) {
  configProvider = std::move(provider);
  return *this;
}

ServerOptions& ServerOptions::withConfig(ServerConfig config) {
  configProvider = [config = std::move(config)]() { return config; };
  return *this;
}

ServerOptions& ServerOptions::withListenerProvider(ListenerProvider provider) {
  listenerProvider = std::move(provider);
  return *this;
}

ServerOptions& ServerOptions::withBoundCallback(BoundCallback callback) {
  boundCallback = std::move(callback);
  return *this;
}

ServerOptions& ServerOptions::withCommonInterceptors(std::vector<Interceptor> interceptors) {
  commonInterceptors = std::move(interceptors);
  return *this;
}

ServerOptions& ServerOptions::withCommonInterceptor(Interceptor interceptor) {
  commonInterceptors.push_back(std::move(interceptor));
  return *this;
}

ServerOptions& ServerOptions::withEndpointProvider(std::shared_ptr<EndpointProvider> provider) {
  endpointProviders.push_back(std::move(provider));
  return *this;
}

ServerOptions& ServerOptions::withEndpoints(EndpointRegistrar registrar) {
  endpointProviders.push_back(std::make_shared<RegistrarEndpointProvider>(std::move(registrar)));
  return *this;
}

}  // namespace portico
