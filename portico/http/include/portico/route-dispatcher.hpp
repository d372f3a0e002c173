#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "portico/http-method.hpp"
#include "portico/http-request.hpp"
#include "portico/http-response.hpp"
#include "portico/interceptor.hpp"
#include "portico/route-table.hpp"

namespace portico {

// Request router built once from a compiled RouteTable.
// For each (path, method) it composes a single handler: common interceptors, then the endpoint's
// own interceptors, then its terminal handler.
// Dispatch semantics:
//  - the request path is matched against registered patterns, literal segments being preferred
//    over parameter segments at the first position where they differ,
//  - if a matching pattern has a handler for the request method (HEAD falls back to GET), it is invoked,
//  - if patterns match but none has the method, the answer is 405 with an Allow header listing the
//    methods of the matching patterns, sorted lexicographically and joined by ", ",
//  - if no pattern matches, the answer is 404.
// All methods are const and safe to call concurrently.
class RouteDispatcher {
 public:
  enum class MatchKind : uint8_t { Found, MethodNotAllowed, NotFound };

  struct Match {
    MatchKind kind{MatchKind::NotFound};
    const RequestHandler* handler{nullptr};
    std::vector<HttpRequest::PathParam> pathParams;
    // Value of the Allow header, set when kind is MethodNotAllowed.
    std::string allowedMethods;
  };

  RouteDispatcher(const RouteTable& table, std::span<const Interceptor> commonInterceptors);

  // Finds the handler for the given path and method, without invoking it.
  [[nodiscard]] Match match(std::string_view path, http::Method method) const;

  // Routes 'request', stores its captured path parameters and returns the response.
  // Exceptions thrown by handlers are propagated.
  HttpResponse dispatch(HttpRequest& request) const;

  [[nodiscard]] std::size_t nbRoutes() const noexcept { return _routes.size(); }

 private:
  struct Segment {
    std::string value;  // parameter name (without braces) for parameter segments
    bool isParam;
  };

  struct Route {
    std::string pattern;
    std::vector<Segment> segments;
    std::array<RequestHandler, http::kNbMethods> handlers;
    http::MethodBmp methods{};
  };

  [[nodiscard]] static bool Matches(const Route& route, std::span<const std::string_view> pathSegments);

  // Sorted by decreasing precedence.
  std::vector<Route> _routes;
};

}  // namespace portico
