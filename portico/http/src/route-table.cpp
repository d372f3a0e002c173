#include "portico/route-table.hpp"

#include <bit>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "portico/http-method.hpp"
#include "portico/http-response.hpp"
#include "portico/http-status-code.hpp"
#include "portico/route-path.hpp"

namespace portico {

namespace {

HttpResponse NotImplemented(const HttpRequest&) { return HttpResponse(http::StatusCodeNotImplemented); }

}  // namespace

const Endpoint* RouteTable::find(std::string_view path, http::Method method) const noexcept {
  const auto pathIt = _routes.find(path);
  if (pathIt == _routes.end()) {
    return nullptr;
  }
  const auto methodIt = pathIt->second.find(method);
  return methodIt == pathIt->second.end() ? nullptr : &methodIt->second;
}

std::size_t RouteTable::nbEndpoints() const noexcept {
  std::size_t nb = 0;
  for (const auto& [path, methods] : _routes) {
    nb += methods.size();
  }
  return nb;
}

RouteTableBuilder& RouteTableBuilder::registerEndpoint(std::string_view path, http::Method method, Endpoint endpoint) {
  if (isCompiled()) {
    throw std::logic_error(
        fmt::format("cannot register endpoint for path \"{}\": the route table is already compiled", path));
  }
  ValidateRoutePath(path);

  const auto methodVal = static_cast<http::MethodIdx>(method);
  if (!std::has_single_bit(methodVal) || http::MethodToIdx(method) >= http::kNbMethods) {
    throw std::invalid_argument(fmt::format("http method \"{}\" is invalid", methodVal));
  }

  if (!endpoint.handler) {
    endpoint.handler = NotImplemented;
  }

  auto pathIt = _routes.find(path);
  if (pathIt == _routes.end()) {
    pathIt = _routes.emplace(path, RouteTable::MethodMap{}).first;
  } else if (pathIt->second.contains(method)) {
    throw std::invalid_argument(
        fmt::format("method \"{}\" already registered for path \"{}\"", http::MethodToStr(method), path));
  }
  pathIt->second.emplace(method, std::move(endpoint));
  return *this;
}

RouteTableBuilder& RouteTableBuilder::registerEndpoint(std::string_view path, std::string_view method,
                                                       Endpoint endpoint) {
  if (isCompiled()) {
    throw std::logic_error(
        fmt::format("cannot register endpoint for path \"{}\": the route table is already compiled", path));
  }
  ValidateRoutePath(path);
  const auto parsedMethod = http::MethodStrToOptEnum(method);
  if (!parsedMethod) {
    throw std::invalid_argument(fmt::format("http method \"{}\" is invalid", method));
  }
  return registerEndpoint(path, *parsedMethod, std::move(endpoint));
}

std::shared_ptr<const RouteTable> RouteTableBuilder::compile() {
  if (!_compiledTable) {
    _compiledTable = std::make_shared<const RouteTable>(RouteTable::PassKey{}, std::move(_routes));
    _routes.clear();
  }
  return _compiledTable;
}

}  // namespace portico
