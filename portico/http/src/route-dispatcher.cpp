#include "portico/route-dispatcher.hpp"

#include <algorithm>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "portico/http-constants.hpp"
#include "portico/http-method.hpp"
#include "portico/http-request.hpp"
#include "portico/http-response.hpp"
#include "portico/http-status-code.hpp"
#include "portico/interceptor.hpp"
#include "portico/route-path.hpp"
#include "portico/route-table.hpp"

namespace portico {

namespace {

// "/" has no segment, "/a/b" has two, "/a/" has "a" and an empty one.
std::vector<std::string_view> SplitSegments(std::string_view path) {
  std::vector<std::string_view> segments;
  if (path.starts_with('/')) {
    path.remove_prefix(1);
  }
  if (path.empty()) {
    return segments;
  }
  while (true) {
    const auto slashPos = path.find('/');
    segments.push_back(path.substr(0, slashPos));
    if (slashPos == std::string_view::npos) {
      break;
    }
    path.remove_prefix(slashPos + 1);
  }
  return segments;
}

std::string SortedMethodList(http::MethodBmp methods) {
  std::vector<std::string_view> names;
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    if (http::IsMethodSet(methods, http::MethodFromIdx(methodIdx))) {
      names.push_back(http::MethodToStr(http::MethodFromIdx(methodIdx)));
    }
  }
  std::ranges::sort(names);

  std::string ret;
  for (std::string_view name : names) {
    if (!ret.empty()) {
      ret.append(", ");
    }
    ret.append(name);
  }
  return ret;
}

}  // namespace

RouteDispatcher::RouteDispatcher(const RouteTable& table, std::span<const Interceptor> commonInterceptors) {
  _routes.reserve(table.routes().size());
  for (const auto& [pattern, methods] : table.routes()) {
    Route& route = _routes.emplace_back();
    route.pattern = pattern;
    for (std::string_view segment : SplitSegments(pattern)) {
      if (IsParamSegment(segment)) {
        route.segments.push_back(Segment{std::string(segment.substr(1, segment.size() - 2U)), true});
      } else {
        route.segments.push_back(Segment{std::string(segment), false});
      }
    }
    for (const auto& [method, endpoint] : methods) {
      std::vector<Interceptor> interceptors(commonInterceptors.begin(), commonInterceptors.end());
      interceptors.insert(interceptors.end(), endpoint.interceptors.begin(), endpoint.interceptors.end());
      route.handlers[http::MethodToIdx(method)] = MakeChain(interceptors, endpoint.handler);
      route.methods = route.methods | method;
    }
  }

  // Literal segments first at the first position where two patterns differ in kind.
  std::ranges::sort(_routes, [](const Route& lhs, const Route& rhs) {
    if (lhs.segments.size() != rhs.segments.size()) {
      return lhs.segments.size() < rhs.segments.size();
    }
    for (std::size_t pos = 0; pos < lhs.segments.size(); ++pos) {
      if (lhs.segments[pos].isParam != rhs.segments[pos].isParam) {
        return rhs.segments[pos].isParam;
      }
    }
    return lhs.pattern < rhs.pattern;
  });
}

bool RouteDispatcher::Matches(const Route& route, std::span<const std::string_view> pathSegments) {
  if (route.segments.size() != pathSegments.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < pathSegments.size(); ++pos) {
    const Segment& segment = route.segments[pos];
    if (segment.isParam ? pathSegments[pos].empty() : segment.value != pathSegments[pos]) {
      return false;
    }
  }
  return true;
}

RouteDispatcher::Match RouteDispatcher::match(std::string_view path, http::Method method) const {
  Match result;
  const auto pathSegments = SplitSegments(path);
  http::MethodBmp allowedMethods = 0;
  for (const Route& route : _routes) {
    if (!Matches(route, pathSegments)) {
      continue;
    }
    const RequestHandler* handler = &route.handlers[http::MethodToIdx(method)];
    if (!*handler && method == http::Method::HEAD) {
      handler = &route.handlers[http::MethodToIdx(http::Method::GET)];
    }
    if (*handler) {
      result.kind = MatchKind::Found;
      result.handler = handler;
      for (std::size_t pos = 0; pos < pathSegments.size(); ++pos) {
        if (route.segments[pos].isParam) {
          result.pathParams.emplace_back(route.segments[pos].value, pathSegments[pos]);
        }
      }
      return result;
    }
    allowedMethods = static_cast<http::MethodBmp>(allowedMethods | route.methods);
  }
  if (allowedMethods != 0) {
    result.kind = MatchKind::MethodNotAllowed;
    result.allowedMethods = SortedMethodList(allowedMethods);
  }
  return result;
}

HttpResponse RouteDispatcher::dispatch(HttpRequest& request) const {
  auto routeMatch = match(request.path(), request.method());
  switch (routeMatch.kind) {
    case MatchKind::Found:
      request.setPathParams(std::move(routeMatch.pathParams));
      return (*routeMatch.handler)(request);
    case MatchKind::MethodNotAllowed:
      return HttpResponse(http::StatusCodeMethodNotAllowed).header(http::Allow, routeMatch.allowedMethods);
    default:
      return HttpResponse(http::StatusCodeNotFound);
  }
}

}  // namespace portico
